// ============================================================
// dispatcher.cpp
// ============================================================

#include "dispatcher.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/media.hpp"
#include "../common/utils.hpp"
#include <chrono>
#include <type_traits>

namespace {

const char* timeout_message(JobKind kind) {
    return kind == JobKind::TRANSCODE ? "Transcoding timed out" : "Archive extraction timed out";
}

std::string job_tag(u64 job_id) {
    return "Job " + std::to_string(job_id);
}

ErrorReply error_reply(ErrorKind kind, const std::string& message) {
    ErrorReply e;
    e.kind    = kind;
    e.message = message;
    return e;
}

} // namespace

Dispatcher::Dispatcher(WorkerManager& workers, TransferStore& transfers, ResultStore& results,
                       ProgressSink& progress, const RelayConfig& cfg)
    : workers_(workers)
    , transfers_(transfers)
    , results_(results)
    , progress_(progress)
    , cfg_(cfg)
{
    workers_.set_message_handler([this](Message msg) { on_worker_message(std::move(msg)); });
}

Dispatcher::~Dispatcher() {
    workers_.set_message_handler(nullptr);
}

u64 Dispatcher::pending_job_id() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return slot_ ? slot_->job_id : 0;
}

// ---------------------------------------------------------------
// Client requests
// ---------------------------------------------------------------

Message Dispatcher::handle_request(const Message& request) {
    transfers_.evict_expired();
    results_.evict_expired();

    try {
        return std::visit(overloaded{
            [&](const JobRequest& req) -> Message {
                if (req.kind == JobKind::EXTRACT_ARCHIVE_DATA) {
                    if (req.payload.empty()) {
                        throw RelayError(ErrorKind::PROTOCOL, "Archive request without data");
                    }
                } else if (req.source_url.empty()) {
                    throw RelayError(ErrorKind::PROTOCOL,
                                     std::string(job_kind_name(req.kind)) + " request without URL");
                }
                JobStart job;
                job.kind       = req.kind;
                job.tab_id     = req.tab_id;
                job.source_url = req.source_url;
                job.payload    = req.payload;
                return run_job(std::move(job), cfg_.job_timeout_ms,
                               utils::generate_transfer_id() + "_result");
            },
            [&](const UploadChunk& chunk) -> Message {
                return transfers_.put_chunk(chunk);
            },
            [&](const UploadProcess& proc) -> Message {
                JobStart job;
                job.kind    = JobKind::EXTRACT_ARCHIVE_DATA;
                job.tab_id  = proc.tab_id;
                job.payload = transfers_.take(proc.transfer_id);
                return run_job(std::move(job), cfg_.large_job_timeout_ms,
                               proc.transfer_id + "_result");
            },
            [&](const GetResultChunk& get) -> Message {
                return results_.pull(get.result_id, get.chunk_index);
            },
            [&](const auto& other) -> Message {
                throw RelayError(ErrorKind::PROTOCOL,
                                 std::string("Unexpected request: ") +
                                 proto::message_name(std::decay_t<decltype(other)>::kType));
            },
        }, request);
    } catch (const RelayError& e) {
        LOG_WARN(std::string(error_kind_name(e.kind())) + ": " + e.what());
        return error_reply(e.kind(), e.what());
    } catch (const std::exception& e) {
        LOG_ERROR(std::string("Request failed: ") + e.what());
        return error_reply(ErrorKind::PROTOCOL, e.what());
    }
}

Message Dispatcher::run_job(JobStart job, u32 timeout_ms, const std::string& result_id) {
    PendingHandle h = submit(std::move(job), timeout_ms);
    EncodedResult result = await(h);
    return respond(result_id, std::move(result));
}

JobResponse Dispatcher::respond(const std::string& result_id, EncodedResult encoded) {
    u64 size = media::encoded_size(encoded);
    if (chunking::needs_chunking(size, cfg_.transport_ceiling)) {
        return results_.store(result_id, encoded);
    }
    JobResponse resp;
    resp.chunked  = false;
    resp.multiple = encoded.multiple;
    resp.result   = std::move(encoded);
    return resp;
}

// ---------------------------------------------------------------
// Job slot
// ---------------------------------------------------------------

Dispatcher::PendingHandle Dispatcher::submit(JobStart job, u32 timeout_ms) {
    std::shared_ptr<MessagePort> port = workers_.ensure_worker();
    workers_.wait_ready();

    job.job_id = next_job_id_.fetch_add(1);

    auto pending = std::make_shared<PendingJob>();
    pending->job_id = job.job_id;
    pending->kind   = job.kind;
    pending->tab_id = job.tab_id;

    PendingHandle h;
    h.job_id     = job.job_id;
    h.kind       = job.kind;
    h.timeout_ms = timeout_ms;
    h.job        = pending;
    h.future     = pending->promise.get_future().share();

    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (slot_) {
            LOG_WARN(job_tag(job.job_id) + " replaces pending " + job_tag(slot_->job_id));
        }
        slot_ = pending;
    }
    LOG_INFO(job_tag(job.job_id) + " " + job_kind_name(job.kind) + " for tab " +
             std::to_string(job.tab_id));

    try {
        send_job(*port, job);
    } catch (const std::exception& e) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (slot_ == pending) slot_.reset();
        }
        throw RelayError(ErrorKind::ENGINE_FAILURE,
                         std::string("Worker connection lost: ") + e.what());
    }
    return h;
}

void Dispatcher::send_job(MessagePort& port, const JobStart& job) {
    if (job.kind != JobKind::EXTRACT_ARCHIVE_DATA ||
        !chunking::needs_chunking(job.payload.size(), cfg_.transport_ceiling)) {
        port.post(job);
        return;
    }

    JobDataStart start;
    start.job_id       = job.job_id;
    start.tab_id       = job.tab_id;
    start.total_chunks = chunking::chunk_count(job.payload.size(), cfg_.transport_ceiling);
    start.total_length = job.payload.size();
    LOG_DEBUG(job_tag(job.job_id) + " input in " + std::to_string(start.total_chunks) + " chunks");

    port.post(start);
    for (u32 i = 0; i < start.total_chunks; ++i) {
        JobDataChunk c;
        c.chunk_index = i;
        c.chunk       = chunking::chunk_at(job.payload, i, cfg_.transport_ceiling);
        c.checksum    = hash::xxh3_32(c.chunk);
        port.post(c);
    }
    port.post(JobDataEnd{});
}

EncodedResult Dispatcher::await(const PendingHandle& h) {
    auto st = h.future.wait_for(std::chrono::milliseconds(h.timeout_ms));
    if (st != std::future_status::ready) {
        bool cleared = false;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            // Resolution happens under mutex_, so this check is final
            if (h.future.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
                if (slot_ == h.job) {
                    slot_.reset();
                    cleared = true;
                }
                st = std::future_status::timeout;
            } else {
                st = std::future_status::ready;
            }
        }
        if (st != std::future_status::ready) {
            LOG_WARN(job_tag(h.job_id) + " timed out after " + std::to_string(h.timeout_ms) +
                     " ms" + (cleared ? "" : " (slot already reassigned)"));
            throw RelayError(ErrorKind::JOB_TIMEOUT, timeout_message(h.kind));
        }
    }
    return h.future.get();
}

void Dispatcher::resolve_locked(EncodedResult result) {
    std::shared_ptr<PendingJob> job = std::move(slot_);
    LOG_INFO(job_tag(job->job_id) + " done");
    job->promise.set_value(std::move(result));
}

void Dispatcher::fail_locked(std::exception_ptr error) {
    std::shared_ptr<PendingJob> job = std::move(slot_);
    job->promise.set_exception(error);
}

// ---------------------------------------------------------------
// Worker traffic
// ---------------------------------------------------------------

void Dispatcher::on_worker_message(Message msg) {
    std::visit(overloaded{
        [&](const Progress& p) {
            try {
                progress_.relay(p);
            } catch (const std::exception& e) {
                LOG_DEBUG(std::string("Progress relay failed: ") + e.what());
            }
        },
        [&](const WorkerResult& r)  { on_result(r); },
        [&](const ResultStart& s)   { on_result_start(s); },
        [&](ResultChunk& c)         { on_result_chunk(std::move(c)); },
        [&](const ResultEnd&)       { on_result_end(); },
        [&](const auto& other) {
            LOG_WARN(std::string("Unexpected worker message: ") +
                     proto::message_name(std::decay_t<decltype(other)>::kType));
        },
    }, msg);
}

void Dispatcher::on_result(const WorkerResult& r) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!slot_ || slot_->job_id != r.job_id) {
        LOG_WARN("Dropping result of " + job_tag(r.job_id) + ": no such pending job");
        return;
    }
    if (r.ok) {
        resolve_locked(r.result);
    } else {
        LOG_WARN(job_tag(r.job_id) + " failed: " + r.error);
        fail_locked(std::make_exception_ptr(RelayError(r.error_kind, r.error)));
    }
}

void Dispatcher::on_result_start(const ResultStart& s) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!slot_ || slot_->job_id != s.job_id) {
        LOG_WARN("Dropping chunked result of " + job_tag(s.job_id) + ": no such pending job");
        if (slot_) slot_->staging.reset();
        return;
    }
    if (s.total_chunks == 0) {
        fail_locked(std::make_exception_ptr(
            RelayError(ErrorKind::PROTOCOL, "Chunked result declares zero chunks")));
        return;
    }
    slot_->staging = std::make_unique<ResultStaging>(s);
    LOG_DEBUG(job_tag(s.job_id) + " result in " + std::to_string(s.total_chunks) + " chunks");
}

void Dispatcher::on_result_chunk(ResultChunk c) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!slot_ || !slot_->staging) {
        LOG_DEBUG("Dropping result chunk " + std::to_string(c.chunk_index));
        return;
    }
    try {
        slot_->staging->chunks.put_verified(c.chunk_index, std::move(c.chunk), c.checksum);
    } catch (const RelayError&) {
        fail_locked(std::current_exception());
    } catch (const std::out_of_range& e) {
        fail_locked(std::make_exception_ptr(RelayError(ErrorKind::PROTOCOL, e.what())));
    }
}

void Dispatcher::on_result_end() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!slot_ || !slot_->staging) {
        LOG_WARN("Dropping end of a result with no pending job");
        return;
    }
    std::unique_ptr<ResultStaging> staging = std::move(slot_->staging);
    try {
        std::string text = staging->chunks.assemble();
        if (text.size() != staging->total_length) {
            throw RelayError(ErrorKind::PROTOCOL,
                             "Result length " + std::to_string(text.size()) +
                             " does not match declared " + std::to_string(staging->total_length));
        }
        EncodedResult result = staging->multiple
            ? media::parse_multi(text)
            : media::single_from_base64(std::move(text), staging->mime_type);
        resolve_locked(std::move(result));
    } catch (const RelayError&) {
        fail_locked(std::current_exception());
    }
}

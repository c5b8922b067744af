// ============================================================
// worker_runtime.cpp
// ============================================================

#include "worker_runtime.hpp"
#include "media_selector.hpp"
#include "../common/base64.hpp"
#include "../common/hash.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <cmath>

WorkerRuntime::WorkerRuntime(std::shared_ptr<MessagePort> port,
                             ConversionEngine& engine,
                             ArchiveReader& archives,
                             SourceFetcher& fetcher,
                             const RelayConfig& cfg)
    : port_(std::move(port))
    , engine_(engine)
    , archives_(archives)
    , fetcher_(fetcher)
    , cfg_(cfg)
{}

WorkerRuntime::~WorkerRuntime() {
    port_->close();
    if (started_) wait_closed();
}

void WorkerRuntime::start() {
    started_ = true;
    port_->start([this](Message msg) { on_message(std::move(msg)); },
                 [this] { on_disconnect(); });

    post(WorkerHello{(u32)::getpid()});
    LOG_INFO("Worker connected, loading engine");

    executor_.post([this] {
        try {
            engine_.load();
        } catch (const std::exception& e) {
            // No READY: the dispatcher proceeds after its readiness wait
            // and jobs report the engine error themselves.
            LOG_ERROR(std::string("Engine load failed: ") + e.what());
            return;
        }
        post(WorkerReady{});
        LOG_INFO("Engine ready");
    });
}

void WorkerRuntime::wait_closed() {
    std::unique_lock<std::mutex> lk(closed_mutex_);
    closed_cv_.wait(lk, [this] { return closed_; });
}

void WorkerRuntime::on_disconnect() {
    // Nobody is left to receive the results of queued jobs
    size_t dropped = executor_.discard_pending();
    LOG_INFO("Dispatcher disconnected" +
             (dropped ? ", dropped " + std::to_string(dropped) + " queued job(s)" : std::string()));
    {
        std::lock_guard<std::mutex> lk(closed_mutex_);
        closed_ = true;
    }
    closed_cv_.notify_all();
}

void WorkerRuntime::post(const Message& msg) {
    try {
        port_->post(msg);
    } catch (const std::runtime_error& e) {
        LOG_WARN(std::string("Cannot post ") + proto::message_name(proto::message_type(msg)) +
                 ": " + e.what());
    }
}

// ---------------------------------------------------------------
// Inbound messages (delivery thread)
// ---------------------------------------------------------------

void WorkerRuntime::on_message(Message msg) {
    std::visit(overloaded{
        [this](JobStart& m)     { enqueue(std::move(m)); },
        [this](JobDataStart& m) { on_job_data_start(m); },
        [this](JobDataChunk& m) { on_job_data_chunk(std::move(m)); },
        [this](JobDataEnd&)     { on_job_data_end(); },
        [](auto& other) {
            LOG_WARN(std::string("Worker ignoring unexpected ") +
                     proto::message_name(std::decay_t<decltype(other)>::kType));
        },
    }, msg);
}

void WorkerRuntime::on_job_data_start(const JobDataStart& m) {
    if (staging_) {
        LOG_WARN("Job " + std::to_string(staging_->job_id) +
                 " input superseded before completion");
    }
    LOG_DEBUG("Staging input for job " + std::to_string(m.job_id) + ": " +
              std::to_string(m.total_chunks) + " chunks, " + utils::format_bytes(m.total_length));
    staging_ = std::make_unique<InputStaging>(m.job_id, m.tab_id, m.total_chunks, m.total_length);
}

void WorkerRuntime::on_job_data_chunk(JobDataChunk m) {
    if (!staging_) {
        LOG_WARN("Input chunk " + std::to_string(m.chunk_index) + " without JOB_DATA_START");
        return;
    }
    if (!staging_->error.empty()) return;
    try {
        staging_->chunks.put_verified(m.chunk_index, std::move(m.chunk), m.checksum);
    } catch (const std::exception& e) {
        staging_->error = e.what();
    }
}

void WorkerRuntime::on_job_data_end() {
    if (!staging_) {
        LOG_WARN("JOB_DATA_END without JOB_DATA_START");
        return;
    }
    std::unique_ptr<InputStaging> st = std::move(staging_);
    if (!st->error.empty()) {
        send_error(st->job_id, ErrorKind::PROTOCOL, st->error);
        return;
    }
    JobStart job;
    job.job_id = st->job_id;
    job.kind   = JobKind::EXTRACT_ARCHIVE_DATA;
    job.tab_id = st->tab_id;
    try {
        job.payload = st->chunks.assemble();
    } catch (const RelayError& e) {
        send_error(st->job_id, e.kind(), e.what());
        return;
    }
    if (job.payload.size() != st->total_length) {
        send_error(st->job_id, ErrorKind::INCOMPLETE_TRANSFER,
                   "Input length mismatch: got " + std::to_string(job.payload.size()) +
                   ", declared " + std::to_string(st->total_length));
        return;
    }
    enqueue(std::move(job));
}

void WorkerRuntime::enqueue(JobStart job) {
    LOG_INFO("Job " + std::to_string(job.job_id) + " queued: " + job_kind_name(job.kind) +
             " (tab " + std::to_string(job.tab_id) + ")");
    auto shared = std::make_shared<JobStart>(std::move(job));
    executor_.post([this, shared] { execute(*shared); });
}

// ---------------------------------------------------------------
// Job execution (job thread)
// ---------------------------------------------------------------

void WorkerRuntime::Reporter::operator()(const std::string& status, int progress) {
    progress = utils::clamp(progress, 0, 100);
    if (status == last_status_ && progress == last_progress_) return;
    last_status_   = status;
    last_progress_ = progress;
    rt_.post(Progress{tab_id_, status, (u32)progress});
}

void WorkerRuntime::execute(const JobStart& job) {
    Reporter report(*this, job.tab_id);
    u64 t0 = utils::now_ms();
    try {
        JobResult result;
        switch (job.kind) {
            case JobKind::TRANSCODE:            result = transcode(job, report); break;
            case JobKind::EXTRACT_ARCHIVE_URL:  result = extract_from_url(job, report); break;
            case JobKind::EXTRACT_ARCHIVE_DATA: result = extract_from_data(job, report); break;
        }
        LOG_INFO("Job " + std::to_string(job.job_id) + " finished in " +
                 std::to_string(utils::now_ms() - t0) + " ms");
        send_result(job.job_id, result);
    } catch (const RelayError& e) {
        send_error(job.job_id, e.kind(), e.what());
    } catch (const std::exception& e) {
        send_error(job.job_id, ErrorKind::ENGINE_FAILURE, e.what());
    }
}

JobResult WorkerRuntime::transcode(const JobStart& job, Reporter& report) {
    report("Downloading video...", 0);
    std::vector<u8> bytes = fetcher_.fetch(job.source_url, [&](u64 done, u64 total) {
        if (total > 0) report("Downloading...", utils::percent(done, total));
    });

    std::string ext = media_select::input_extension(job.source_url);
    EngineJob ej;
    ej.input_name  = "input." + ext;
    ej.output_name = "output.mp4";
    ej.args        = media_select::transcode_args(ej.input_name, ej.output_name);
    ej.input       = std::move(bytes);

    report("Transcoding...", 0);
    std::vector<u8> out = engine_.run(ej, [&](double f) {
        report("Transcoding...", (int)std::lround(f * 100));
    });
    return SingleMedia{std::move(out), "video/mp4"};
}

MediaItem WorkerRuntime::make_playable(const ArchiveEntry& entry, const std::string& input_name,
                                       const std::string& output_name,
                                       const ConversionEngine::ProgressFn& progress,
                                       const std::function<void()>& before_transcode) {
    std::string ext = media_select::media_extension(entry.name);
    std::vector<u8> data = entry.read();
    if (media_select::is_native(ext)) {
        return MediaItem{entry.name, std::move(data), media_select::mime_for(ext)};
    }
    if (before_transcode) before_transcode();
    EngineJob ej;
    ej.input_name  = input_name + "." + ext;
    ej.output_name = output_name;
    ej.args        = media_select::transcode_args(ej.input_name, ej.output_name);
    ej.input       = std::move(data);
    return MediaItem{entry.name, engine_.run(ej, progress), "video/mp4"};
}

JobResult WorkerRuntime::extract_from_url(const JobStart& job, Reporter& report) {
    report("Downloading archive...", 0);
    std::vector<u8> bytes = fetcher_.fetch(job.source_url, [&](u64 done, u64 total) {
        if (total > 0) report("Downloading archive...", utils::percent(done, total));
    });

    report("Extracting archive...", 0);
    std::unique_ptr<OpenArchive> archive = archives_.open(std::move(bytes));
    const ArchiveEntry* entry = media_select::first_media(archive->entries());
    if (!entry) {
        throw RelayError(ErrorKind::NO_MEDIA_FOUND, "No video file found in archive");
    }
    LOG_INFO("Job " + std::to_string(job.job_id) + " picked " + entry->name);

    report("Extracting video 1/1...", 50);
    MediaItem item = make_playable(*entry, "input", "output.mp4",
        [&](double f) { report("Transcoding...", (int)std::lround(f * 100)); },
        [&] { report("Processing...", 75); });
    report("Done!", 100);
    return SingleMedia{std::move(item.data), item.mime_type};
}

JobResult WorkerRuntime::extract_from_data(const JobStart& job, Reporter& report) {
    report("Processing...", 0);
    std::vector<u8> bytes;
    try {
        bytes = base64::decode(job.payload);
    } catch (const std::invalid_argument& e) {
        throw RelayError(ErrorKind::PROTOCOL, std::string("Archive payload: ") + e.what());
    }

    report("Extracting archive...", 0);
    std::unique_ptr<OpenArchive> archive = archives_.open(std::move(bytes));
    std::vector<const ArchiveEntry*> found = media_select::all_media(archive->entries());
    if (found.empty()) {
        throw RelayError(ErrorKind::NO_MEDIA_FOUND, "No video file found in archive");
    }
    LOG_INFO("Job " + std::to_string(job.job_id) + " found " +
             std::to_string(found.size()) + " video(s)");

    const size_t n = found.size();
    MultiMedia multi;
    for (size_t i = 0; i < n; ++i) {
        std::string counter = std::to_string(i + 1) + "/" + std::to_string(n);
        double base = (double)i / (double)n * 100.0;
        report("Extracting video " + counter + "...", (int)std::lround(base));
        multi.items.push_back(make_playable(*found[i],
            "input_" + std::to_string(i), "output_" + std::to_string(i) + ".mp4",
            [&](double f) {
                report("Transcoding video " + counter + "...",
                       (int)std::lround(base + f * 100.0 / (double)n));
            },
            [&] { report("Transcoding video " + counter + "...", (int)std::lround(base)); }));
    }
    report("Done!", 100);

    if (multi.items.size() == 1) {
        MediaItem& only = multi.items.front();
        return SingleMedia{std::move(only.data), only.mime_type};
    }
    return multi;
}

// ---------------------------------------------------------------
// Results
// ---------------------------------------------------------------

void WorkerRuntime::send_result(u64 job_id, const JobResult& result) {
    EncodedResult encoded = media::encode_result(result);
    u64 size = media::encoded_size(encoded);
    if (!chunking::needs_chunking(size, cfg_.transport_ceiling)) {
        WorkerResult r;
        r.job_id = job_id;
        r.ok     = true;
        r.result = std::move(encoded);
        post(r);
        return;
    }

    ResultStart start;
    start.job_id   = job_id;
    start.multiple = encoded.multiple;
    std::string text;
    if (encoded.multiple) {
        text = media::serialize_multi(encoded);
    } else {
        start.mime_type = encoded.items.front().mime_type;
        text = std::move(encoded.items.front().base64);
    }
    start.total_chunks = chunking::chunk_count(text.size(), cfg_.transport_ceiling);
    start.total_length = text.size();
    LOG_INFO("Job " + std::to_string(job_id) + " result " + utils::format_bytes(text.size()) +
             " in " + std::to_string(start.total_chunks) + " chunks");

    post(start);
    for (u32 i = 0; i < start.total_chunks; ++i) {
        ResultChunk c;
        c.chunk_index = i;
        c.chunk       = chunking::chunk_at(text, i, cfg_.transport_ceiling);
        c.checksum    = hash::xxh3_32(c.chunk);
        post(c);
    }
    post(ResultEnd{});
}

void WorkerRuntime::send_error(u64 job_id, ErrorKind kind, const std::string& message) {
    Logger::get().job_error("job " + std::to_string(job_id) + " " + error_kind_name(kind) +
                            ": " + message);
    WorkerResult r;
    r.job_id     = job_id;
    r.ok         = false;
    r.error_kind = kind;
    r.error      = message;
    post(r);
}

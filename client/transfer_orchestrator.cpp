// ============================================================
// transfer_orchestrator.cpp
// ============================================================

#include "transfer_orchestrator.hpp"
#include "../common/base64.hpp"
#include "../common/chunking.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"

namespace {

u32 step_percent(u32 done, u32 total) {
    return (u32)utils::percent(done, total);
}

} // namespace

TransferOrchestrator::TransferOrchestrator(DispatcherLink& link, SourceFetcher& fetcher,
                                           const RelayConfig& cfg, u32 tab_id)
    : link_(link)
    , fetcher_(fetcher)
    , cfg_(cfg)
    , tab_id_(tab_id)
{
    link_.set_progress_handler([this](const Progress& p) {
        if (p.tab_id == tab_id_) status(p.status, p.progress);
    });
}

TransferOrchestrator::~TransferOrchestrator() {
    link_.set_progress_handler(nullptr);
}

void TransferOrchestrator::set_status_handler(StatusFn fn) {
    on_status_ = std::move(fn);
}

void TransferOrchestrator::status(const std::string& text, u32 percent) {
    if (on_status_) on_status_(text, percent);
}

JobResult TransferOrchestrator::transcode(const std::string& url) {
    status("Starting transcoding...", 0);
    JobRequest req;
    req.kind       = JobKind::TRANSCODE;
    req.tab_id     = tab_id_;
    req.source_url = url;
    return run_request(std::move(req));
}

JobResult TransferOrchestrator::extract_archive_remote(const std::string& url) {
    status("Starting extraction...", 0);
    JobRequest req;
    req.kind       = JobKind::EXTRACT_ARCHIVE_URL;
    req.tab_id     = tab_id_;
    req.source_url = url;
    return run_request(std::move(req));
}

JobResult TransferOrchestrator::extract_archive(const std::string& url) {
    status("Downloading archive...", 0);
    std::vector<u8> bytes = fetcher_.fetch(url, [this](u64 done, u64 total) {
        if (total > 0) status("Downloading archive...", (u32)utils::percent(done, total));
    });
    LOG_INFO("Fetched archive " + url + " (" + utils::format_bytes(bytes.size()) + ")");

    status("Processing archive...", 0);
    std::string encoded = base64::encode(bytes);
    bytes.clear();
    bytes.shrink_to_fit();

    if (chunking::needs_chunking(encoded.size(), cfg_.transport_ceiling)) {
        return upload_and_process(encoded);
    }

    status("Extracting...", 0);
    JobRequest req;
    req.kind    = JobKind::EXTRACT_ARCHIVE_DATA;
    req.tab_id  = tab_id_;
    req.payload = std::move(encoded);
    return run_request(std::move(req));
}

JobResult TransferOrchestrator::upload_and_process(const std::string& encoded) {
    std::string transfer_id = utils::generate_transfer_id();
    u32 total = chunking::chunk_count(encoded.size(), cfg_.transport_ceiling);
    LOG_INFO("Uploading " + utils::format_bytes(encoded.size()) + " as transfer " +
             transfer_id + " in " + std::to_string(total) + " chunks");

    for (u32 i = 0; i < total; ++i) {
        status("Transferring... " + std::to_string(step_percent(i + 1, total)) + "%",
               step_percent(i + 1, total));
        UploadChunk c;
        c.transfer_id  = transfer_id;
        c.chunk_index  = i;
        c.total_chunks = total;
        c.chunk        = chunking::chunk_at(encoded, i, cfg_.transport_ceiling);
        c.checksum     = hash::xxh3_32(c.chunk);
        UploadAck ack = link_.call<UploadAck>(c);
        LOG_DEBUG("Chunk " + std::to_string(i) + " acked (" + std::to_string(ack.received) +
                  "/" + std::to_string(ack.total) + ")");
    }

    status("Extracting...", 0);
    UploadProcess proc;
    proc.transfer_id = transfer_id;
    proc.tab_id      = tab_id_;
    return retrieve(link_.call<JobResponse>(proc));
}

JobResult TransferOrchestrator::run_request(JobRequest req) {
    return retrieve(link_.call<JobResponse>(req));
}

JobResult TransferOrchestrator::retrieve(JobResponse resp) {
    if (!resp.chunked) {
        return media::decode_result(resp.result);
    }

    std::string text;
    text.reserve((size_t)resp.total_length);
    for (u32 i = 0; i < resp.total_chunks; ++i) {
        status("Receiving result... " + std::to_string(step_percent(i + 1, resp.total_chunks)) + "%",
               step_percent(i + 1, resp.total_chunks));
        GetResultChunk get;
        get.result_id   = resp.result_id;
        get.chunk_index = i;
        ResultChunkReply reply = link_.call<ResultChunkReply>(get);
        if (hash::xxh3_32(reply.chunk) != reply.checksum) {
            throw RelayError(ErrorKind::PROTOCOL,
                             "Chunk checksum mismatch at index " + std::to_string(i));
        }
        text += reply.chunk;
    }
    if (text.size() != resp.total_length) {
        throw RelayError(ErrorKind::INCOMPLETE_TRANSFER,
                         "Result " + resp.result_id + " has " + std::to_string(text.size()) +
                         " of " + std::to_string(resp.total_length) + " bytes");
    }

    EncodedResult encoded = resp.multiple
        ? media::parse_multi(text)
        : media::single_from_base64(std::move(text), resp.mime_type);
    return media::decode_result(encoded);
}

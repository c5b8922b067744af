#pragma once

// ============================================================
// transfer_orchestrator.hpp -- Client side of a job
//
//   transcode(url)               JOB_REQUEST, worker fetches
//   extract_archive_remote(url)  JOB_REQUEST, worker fetches
//   extract_archive(url)         fetch here, base64, then either
//                                  one EXTRACT_ARCHIVE_DATA request, or
//                                  UPLOAD_CHUNK x N + UPLOAD_PROCESS
//
// A chunked JOB_RESPONSE is pulled with GET_RESULT_CHUNK 0..N-1 and
// decoded by its declared shape. Nothing is retried.
// ============================================================

#include "dispatcher_link.hpp"
#include "../common/config.hpp"
#include "../common/media.hpp"
#include "../common/source_fetcher.hpp"
#include <string>
#include <functional>

class TransferOrchestrator {
public:
    using StatusFn = std::function<void(const std::string& status, u32 percent)>;

    TransferOrchestrator(DispatcherLink& link, SourceFetcher& fetcher,
                         const RelayConfig& cfg, u32 tab_id);
    ~TransferOrchestrator();

    // Local statuses ("Transferring... N%", ...) and the worker's
    // PROGRESS for this tab
    void set_status_handler(StatusFn fn);

    JobResult transcode(const std::string& url);
    JobResult extract_archive_remote(const std::string& url);
    JobResult extract_archive(const std::string& url);

    u32 tab_id() const { return tab_id_; }

private:
    JobResult run_request(JobRequest req);
    JobResult upload_and_process(const std::string& encoded);

    // Inline result, or pull the stored one
    JobResult retrieve(JobResponse resp);

    void status(const std::string& text, u32 percent);

    DispatcherLink& link_;
    SourceFetcher&  fetcher_;
    RelayConfig     cfg_;
    u32             tab_id_;
    StatusFn        on_status_;
};

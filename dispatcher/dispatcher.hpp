#pragma once

// ============================================================
// dispatcher.hpp -- Single-slot job dispatcher
//
// Client requests come in through handle_request(), one call per
// request, on the caller's thread. Job requests block until the
// worker answers or the job's deadline passes.
//
// At most one job is pending. A new submission overwrites the slot;
// the job it replaced can then only end by its own deadline. Worker
// results carry the job id and are dropped unless it matches the
// job in the slot.
//
//   JOB_REQUEST          -> submit -> await -> inline or stored result
//   UPLOAD_CHUNK         -> TransferStore -> UPLOAD_ACK
//   UPLOAD_PROCESS       -> TransferStore::take -> submit (large deadline)
//   GET_RESULT_CHUNK     -> ResultStore::pull
// ============================================================

#include "worker_manager.hpp"
#include "transfer_store.hpp"
#include "result_store.hpp"
#include "../common/config.hpp"
#include "../common/chunking.hpp"
#include "../common/message.hpp"
#include <memory>
#include <mutex>
#include <future>
#include <atomic>

// Pushes worker progress to whoever submitted the tab's job
class ProgressSink {
public:
    virtual ~ProgressSink() = default;
    virtual void relay(const Progress& progress) = 0;
};

class Dispatcher {
public:
    struct PendingJob;

    struct PendingHandle {
        u64                               job_id{0};
        JobKind                           kind{JobKind::TRANSCODE};
        u32                               timeout_ms{0};
        std::shared_ptr<PendingJob>       job;
        std::shared_future<EncodedResult> future;
    };

    Dispatcher(WorkerManager& workers, TransferStore& transfers, ResultStore& results,
               ProgressSink& progress, const RelayConfig& cfg);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // Never throws: failures come back as ErrorReply
    Message handle_request(const Message& request);

    // Obtain the worker, install the job in the slot and send it.
    // Throws RelayError(CREATION_TIMEOUT) if no worker connects.
    PendingHandle submit(JobStart job, u32 timeout_ms);

    // Result of a submitted job, or RelayError (JOB_TIMEOUT, or the
    // worker's failure)
    EncodedResult await(const PendingHandle& handle);

    // Worker -> dispatcher traffic (PROGRESS, RESULT*, ...)
    void on_worker_message(Message msg);

    // Job id in the slot, 0 when empty
    u64 pending_job_id() const;

private:
    struct ResultStaging {
        bool           multiple{false};
        std::string    mime_type;
        u64            total_length{0};
        ChunkAssembler chunks;

        ResultStaging(const ResultStart& s)
            : multiple(s.multiple), mime_type(s.mime_type),
              total_length(s.total_length), chunks(s.total_chunks) {}
    };

    Message run_job(JobStart job, u32 timeout_ms, const std::string& result_id);
    JobResponse respond(const std::string& result_id, EncodedResult encoded);
    void send_job(MessagePort& port, const JobStart& job);

    void on_result(const WorkerResult& r);
    void on_result_start(const ResultStart& s);
    void on_result_chunk(ResultChunk c);
    void on_result_end();

    // Resolve or fail the slot's job and clear the slot; mutex_ held
    void resolve_locked(EncodedResult result);
    void fail_locked(std::exception_ptr error);

    WorkerManager& workers_;
    TransferStore& transfers_;
    ResultStore&   results_;
    ProgressSink&  progress_;
    RelayConfig    cfg_;

    mutable std::mutex          mutex_;
    std::shared_ptr<PendingJob> slot_;
    std::atomic<u64>            next_job_id_{1};
};

struct Dispatcher::PendingJob {
    u64                            job_id{0};
    JobKind                        kind{JobKind::TRANSCODE};
    u32                            tab_id{0};
    std::promise<EncodedResult>    promise;
    std::unique_ptr<ResultStaging> staging;
};

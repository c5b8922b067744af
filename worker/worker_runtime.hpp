#pragma once

// ============================================================
// worker_runtime.hpp -- Worker context: owns the engine and the
//                       archive reader, runs one job at a time
//
// Lifecycle on a fresh port:
//   WORKER_HELLO -> engine.load() on the job thread -> WORKER_READY
// Jobs arrive as JOB_START, or as JOB_DATA_START/CHUNK*/END when the
// archive bytes exceed the transport ceiling. Results go back as one
// RESULT, or RESULT_START/CHUNK*/END above the ceiling.
// ============================================================

#include "engine.hpp"
#include "archive.hpp"
#include "../common/config.hpp"
#include "../common/message_port.hpp"
#include "../common/source_fetcher.hpp"
#include "../common/serial_executor.hpp"
#include "../common/chunking.hpp"
#include "../common/media.hpp"
#include <memory>
#include <mutex>
#include <condition_variable>

class WorkerRuntime {
public:
    WorkerRuntime(std::shared_ptr<MessagePort> port,
                  ConversionEngine& engine,
                  ArchiveReader& archives,
                  SourceFetcher& fetcher,
                  const RelayConfig& cfg);
    ~WorkerRuntime();

    WorkerRuntime(const WorkerRuntime&) = delete;
    WorkerRuntime& operator=(const WorkerRuntime&) = delete;

    // Start delivery, announce HELLO and queue the engine load
    void start();

    // Block until the dispatcher side goes away. Jobs still queued at
    // that point are dropped.
    void wait_closed();

private:
    // Reports "status, percent" for the job's tab
    class Reporter {
    public:
        Reporter(WorkerRuntime& rt, u32 tab_id) : rt_(rt), tab_id_(tab_id) {}
        void operator()(const std::string& status, int progress);
    private:
        WorkerRuntime& rt_;
        u32            tab_id_;
        std::string    last_status_;
        int            last_progress_{-1};
    };

    // Chunked archive input being staged for one job
    struct InputStaging {
        u64            job_id{0};
        u32            tab_id{0};
        u64            total_length{0};
        ChunkAssembler chunks;
        std::string    error;  // first staging failure

        InputStaging(u64 id, u32 tab, u32 total, u64 len)
            : job_id(id), tab_id(tab), total_length(len), chunks(total) {}
    };

    void on_message(Message msg);
    void on_disconnect();

    void on_job_data_start(const JobDataStart& m);
    void on_job_data_chunk(JobDataChunk m);
    void on_job_data_end();

    void enqueue(JobStart job);
    void execute(const JobStart& job);

    JobResult transcode(const JobStart& job, Reporter& report);
    JobResult extract_from_url(const JobStart& job, Reporter& report);
    JobResult extract_from_data(const JobStart& job, Reporter& report);

    // Native entries pass through, others are transcoded
    MediaItem make_playable(const ArchiveEntry& entry, const std::string& input_name,
                            const std::string& output_name,
                            const ConversionEngine::ProgressFn& progress,
                            const std::function<void()>& before_transcode);

    void send_result(u64 job_id, const JobResult& result);
    void send_error(u64 job_id, ErrorKind kind, const std::string& message);
    void post(const Message& msg);

    std::shared_ptr<MessagePort>  port_;
    ConversionEngine&             engine_;
    ArchiveReader&                archives_;
    SourceFetcher&                fetcher_;
    RelayConfig                   cfg_;

    // Touched only on the port's delivery thread
    std::unique_ptr<InputStaging> staging_;

    std::mutex                    closed_mutex_;
    std::condition_variable       closed_cv_;
    bool                          closed_{false};
    bool                          started_{false};

    // Last member: joined first, while everything it uses is alive
    SerialExecutor                executor_{"worker-job"};
};

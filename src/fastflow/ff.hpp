#ifndef FASTFLOW_AGGREGATOR_HPP
#define FASTFLOW_AGGREGATOR_HPP

#include <ff/ff.hpp>
#include <ff/farm.hpp>
#include <ff/utils.hpp>
#include <vector>
#include <string>
#include <memory>
#include <exception>
#include <iostream>

#include "../include/chunk_aggregate.hpp"
#include "../include/input_file.hpp"
#include "../chunking/chunking.hpp"
#include "../merging/merging.hpp"

using namespace ff;

// What a worker hands to the collector when its stream ends
struct WorkerResult {
    ssize_t worker_id;
    std::unique_ptr<LocalAggregator> local;
    size_t records;
    std::exception_ptr error;
};

// ------------------------
// FastFlow Node: Wake Emitter
// ------------------------
// Sends one start token per worker; the chunks themselves come from the shared cursor
class WakeEmitter : public ff_node {
private:
    size_t num_workers_;
    std::vector<int> tokens_;

public:
    explicit WakeEmitter(size_t num_workers)
        : num_workers_(num_workers), tokens_(num_workers) {}

    void* svc(void*) override {
        for (size_t i = 0; i < num_workers_; ++i) {
            tokens_[i] = static_cast<int>(i);
            ff_send_out(&tokens_[i]);
        }
        return EOS; // End of stream
    }
};

// ------------------------
// FastFlow Node: Aggregate Worker
// ------------------------
// Claims chunks until the cursor runs dry, then forwards its local map on end of stream
class AggregateWorker : public ff_node {
private:
    WorkDistributor& distributor_;
    const ChunkLocator& locator_;
    std::vector<char> buffer_;
    std::unique_ptr<LocalAggregator> local_;
    size_t records_{0};
    std::exception_ptr error_;

public:
    AggregateWorker(WorkDistributor& distributor, const ChunkLocator& locator)
        : distributor_(distributor), locator_(locator),
          local_(std::make_unique<LocalAggregator>()) {}

    int svc_init() override {
        buffer_.resize(locator_.buffer_size());
        return 0;
    }

    void* svc(void*) override {
        // A second token (uneven scheduling) finds the cursor exhausted and does nothing
        if (error_) return GO_ON;
        try {
            records_ += aggregate_until_exhausted(distributor_, locator_, buffer_, *local_);
        } catch (...) {
            error_ = std::current_exception();
        }
        return GO_ON;
    }

    void eosnotify(ssize_t) override {
        ff_send_out(new WorkerResult{get_my_id(), std::move(local_), records_, error_});
    }
};

// ------------------------
// FastFlow Node: Merge Collector
// ------------------------
// Merges each worker's local map into the global one, exactly once per worker
class MergeCollector : public ff_node {
private:
    GlobalMerger& merger_;
    size_t records_{0};
    std::exception_ptr error_;

public:
    explicit MergeCollector(GlobalMerger& merger) : merger_(merger) {}

    void* svc(void* task_ptr) override {
        std::unique_ptr<WorkerResult> result(static_cast<WorkerResult*>(task_ptr));

        if (result->error) {
            if (!error_) error_ = result->error;
            return GO_ON;
        }

        try {
            merger_.merge_in(*result->local);
            records_ += result->records;
        } catch (...) {
            if (!error_) error_ = std::current_exception();
        }
        return GO_ON;
    }

    size_t records() const { return records_; }
    std::exception_ptr error() const { return error_; }
};

// ------------------------
// Main class: FastFlowAggregator
// ------------------------
// Emitter -> N aggregate workers -> merge collector
class FastFlowAggregator {
private:
    uint64_t chunk_size;
    int num_workers;
    uint64_t lookback_margin;
    bool verbose;

public:
    FastFlowAggregator(uint64_t chunk_size_bytes = DEFAULT_CHUNK_SIZE, int workers = 4,
                       uint64_t lookback = DEFAULT_LOOKBACK_MARGIN, bool verbose_output = true)
        : chunk_size(chunk_size_bytes), num_workers(workers > 0 ? workers : 1),
          lookback_margin(lookback), verbose(verbose_output) {}

    GlobalMap aggregate_file(const std::string& input_file) {
        InputFile file(input_file);
        if (verbose) {
            double file_size_mb = static_cast<double>(file.size()) / (1024 * 1024);
            std::cout << "[FF] input=" << input_file << " (" << file_size_mb << " MB)"
                      << ", workers=" << num_workers
                      << ", chunk=" << (chunk_size / 1024) << " KB"
                      << ", lookback=" << lookback_margin << " B" << std::endl;
        }

        WorkDistributor distributor(file.size(), chunk_size);
        ChunkLocator locator(file, chunk_size, lookback_margin);
        GlobalMerger merger;

        ff::ffTime(ff::START_TIME);

        WakeEmitter emitter(num_workers);
        MergeCollector collector(merger);

        std::vector<std::unique_ptr<AggregateWorker>> workers;
        std::vector<ff_node*> workers_v;
        for (int i = 0; i < num_workers; ++i) {
            workers.push_back(std::make_unique<AggregateWorker>(distributor, locator));
            workers_v.push_back(workers.back().get());
        }

        // Set up FastFlow farm
        ff_farm farm;
        farm.add_emitter(&emitter);
        farm.add_workers(workers_v);
        farm.add_collector(&collector);

        if (farm.run_and_wait_end() < 0) {
            throw std::runtime_error("FastFlow farm execution failed");
        }

        ff::ffTime(ff::STOP_TIME);
        double elapsed_ms = ff::ffTime(ff::GET_TIME);

        if (collector.error()) std::rethrow_exception(collector.error());

        if (verbose) {
            std::cout << "[LOG] " << collector.records() << " records, " << merger.size() << " keys" << std::endl;
            std::cout << "[TIMING] Scan + merge time: " << (elapsed_ms / 1000.0) << " s" << std::endl;
        }

        return merger.take();
    }
};

#endif

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <random>
#include <string>

#include "glog/logging.h"
#include "cxxopts.hpp"

#include "common/config.h"
#include "operators/union_pipe.h"
#include "stream/memory_manager.h"

using namespace Estuary;

using Batch = StreamBatch<Empty, int64_t>;
using Pool = BatchPool<Empty, int64_t>;

namespace {

/**
 * Checks output order and counts what reaches the sink
 */
class VerifyingObserver : public IStreamObserver<Empty, int64_t> {
public:
    VerifyingObserver(std::shared_ptr<Pool> pool, bool verify) : pool_(std::move(pool)), verify_(verify) {}

    void OnNext(Batch::Ptr batch) override {
        ++batches;
        for (size_t i = 0; verify_ && i < batch->Count(); ++i) {
            if (!batch->IsVisible(i)) continue;
            const int64_t t = batch->vsync[i];
            if (t < last_time_) {
                if (errors++ < 10) LOG(ERROR) << "Out of order: " << t << " after " << last_time_;
            }
            last_time_ = t;
            if (IsPunctuation(batch->vother[i])) {
                if (t <= last_punctuation_ && errors++ < 10) {
                    LOG(ERROR) << "Redundant punctuation " << t << " after " << last_punctuation_;
                }
                last_punctuation_ = t;
                ++punctuations;
            } else {
                ++events;
            }
        }
        pool_->Return(std::move(batch));
    }

    void OnCompleted() override { completed = true; }
    void OnFlush() override {}
    void ProduceQueryPlan(PlanNode::Ptr node) override { plan = std::move(node); }

    uint64_t batches = 0;
    uint64_t events = 0;
    uint64_t punctuations = 0;
    uint64_t errors = 0;
    bool completed = false;
    PlanNode::Ptr plan;

private:
    std::shared_ptr<Pool> pool_;
    bool verify_;
    int64_t last_time_ = kMinSyncTime;
    int64_t last_punctuation_ = kMinSyncTime;
};

/**
 * Synthetic side of the union. Sides alternate in runs of run_length sync-times,
 * so small runs force row-by-row merging and long runs let whole batches through.
 */
class SideGenerator {
public:
    SideGenerator(bool is_left, uint64_t events, uint64_t run_length, uint64_t punct_period,
                  double delete_ratio, uint64_t seed)
        : is_left_(is_left), remaining_(events), run_length_(run_length),
          punct_period_(punct_period), delete_dist_(delete_ratio), rng_(seed) {}

    bool Done() const { return remaining_ == 0; }

    Batch::Ptr Next(Pool& pool) {
        Batch::Ptr batch = pool.Get();
        while (remaining_ > 0 && !batch->IsFull()) {
            const int64_t t = SyncTime(produced_);
            if (punct_period_ > 0 && produced_ > 0 && produced_ % punct_period_ == 0 && !punct_pending_) {
                batch->AddPunctuation(t);
                punct_pending_ = true;
                continue;
            }
            punct_pending_ = false;
            size_t i = batch->Add(t, kInfinitySyncTime, Empty(), static_cast<int64_t>(produced_), 0);
            if (delete_dist_(rng_)) batch->SetDeleted(i);
            ++produced_;
            --remaining_;
        }
        batch->Seal();
        return batch;
    }

private:
    int64_t SyncTime(uint64_t i) const {
        const uint64_t run = i / run_length_;
        const uint64_t offset = i % run_length_;
        return static_cast<int64_t>((2 * run + (is_left_ ? 0 : 1)) * run_length_ + offset);
    }

    bool is_left_;
    uint64_t remaining_;
    uint64_t run_length_;
    uint64_t punct_period_;
    uint64_t produced_ = 0;
    bool punct_pending_ = false;
    std::bernoulli_distribution delete_dist_;
    std::mt19937_64 rng_;
};

} // namespace

int main(int argc, char** argv) {
    google::InitGoogleLogging(argv[0]);
    std::ios::sync_with_stdio(false);
    cxxopts::Options options("union_micro", "Temporal union microbenchmark");
    options.add_options()
        ("events", "Data events per side", cxxopts::value<uint64_t>()->default_value("10000000"))
        ("run_length", "Consecutive sync-times owned by one side before the other takes over", cxxopts::value<uint64_t>()->default_value("1"))
        ("punct_period", "Data events between punctuations (0 = none)", cxxopts::value<uint64_t>()->default_value("1000"))
        ("delete_ratio", "0.0..1.0 fraction of data events marked deleted", cxxopts::value<double>()->default_value("0.0"))
        ("seed", "PRNG seed", cxxopts::value<uint64_t>()->default_value("1"))
        ("config", "YAML configuration file", cxxopts::value<std::string>())
        ("deterministic", "Override deterministic_within_timestamp (0/1)", cxxopts::value<int>())
        ("verify", "Check output ordering (0/1)", cxxopts::value<int>()->default_value("1"))
        ("plan", "Print the query plan (0/1)", cxxopts::value<int>()->default_value("0"))
        ("v,verbose", "glog verbosity", cxxopts::value<int>()->default_value("0"))
        ("help", "Print usage");

    auto result = options.parse(argc, argv);
    if (result.count("help")) {
        std::cout << options.help() << std::endl;
        return 0;
    }
    FLAGS_v = result["verbose"].as<int>();
    FLAGS_logtostderr = 1;

    Configuration& config = Configuration::getInstance();
    if (result.count("config")) {
        const std::string path = result["config"].as<std::string>();
        if (!config.loadFromFile(path)) {
            for (const auto& error : config.getValidationErrors()) LOG(ERROR) << error;
            LOG(ERROR) << "Failed to load configuration from " << path;
            return 1;
        }
    }
    if (result.count("deterministic")) {
        config.config().engine.deterministic_within_timestamp.set(result["deterministic"].as<int>() != 0);
    }

    const uint64_t events = result["events"].as<uint64_t>();
    const uint64_t run_length = result["run_length"].as<uint64_t>();
    const uint64_t punct_period = result["punct_period"].as<uint64_t>();
    const double delete_ratio = result["delete_ratio"].as<double>();
    const uint64_t seed = result["seed"].as<uint64_t>();
    const bool verify = result["verify"].as<int>() != 0;

    if (run_length == 0 || delete_ratio < 0.0 || delete_ratio > 1.0) {
        LOG(ERROR) << "run_length must be positive and delete_ratio within [0, 1]";
        return 1;
    }

    std::cout << "Config: events=" << events
              << " run_length=" << run_length
              << " punct_period=" << punct_period
              << " delete_ratio=" << delete_ratio
              << " data_batch_size=" << config.getDataBatchSize()
              << " deterministic=" << config.getDeterministicWithinTimestamp() << std::endl;

    auto pool = MemoryManager::GetMemoryPool<Empty, int64_t>(true);
    auto observer = std::make_shared<VerifyingObserver>(pool, verify);
    UnionPipe<Empty, int64_t> pipe(StreamProperties{true, "union_micro"}, observer);

    if (result["plan"].as<int>() != 0) {
        auto left = std::make_shared<IngressPlanNode>(nullptr, TypeName<Empty>(), TypeName<int64_t>(), "left");
        auto right = std::make_shared<IngressPlanNode>(nullptr, TypeName<Empty>(), TypeName<int64_t>(), "right");
        pipe.ProduceQueryPlan(left, right);
        if (observer->plan) std::cout << observer->plan->ToString();
    }

    SideGenerator left(true, events, run_length, punct_period, delete_ratio, seed);
    SideGenerator right(false, events, run_length, punct_period, delete_ratio, seed + 1);

    using Clock = std::chrono::steady_clock;
    Clock::duration in_union{0};
    while (!left.Done() || !right.Done()) {
        if (!left.Done()) {
            Batch::Ptr batch = left.Next(*pool);
            auto start = Clock::now();
            pipe.OnNextLeft(std::move(batch));
            in_union += Clock::now() - start;
        }
        if (!right.Done()) {
            Batch::Ptr batch = right.Next(*pool);
            auto start = Clock::now();
            pipe.OnNextRight(std::move(batch));
            in_union += Clock::now() - start;
        }
    }
    auto start = Clock::now();
    pipe.OnCompletedLeft();
    pipe.OnCompletedRight();
    in_union += Clock::now() - start;

    const double seconds = std::chrono::duration<double>(in_union).count();
    const UnionPipeStats& stats = pipe.stats();
    std::cout << "Union: " << (2 * events) << " events in " << seconds << " s ("
              << (seconds > 0 ? static_cast<double>(2 * events) / seconds / 1e6 : 0.0) << " M events/s)" << std::endl;
    std::cout << "Stats: left_forwarded=" << stats.left_batches_forwarded
              << " right_forwarded=" << stats.right_batches_forwarded
              << " rows_copied=" << stats.rows_copied
              << " punctuations_suppressed=" << stats.punctuations_suppressed
              << " output_flushed=" << stats.output_batches_flushed
              << " sink_batches=" << observer->batches << std::endl;

    pipe.Dispose();

    if (!observer->completed) {
        LOG(ERROR) << "Union did not complete";
        return 1;
    }
    if (verify) {
        std::cout << "Sink: events=" << observer->events << " punctuations=" << observer->punctuations << std::endl;
        std::cout << (observer->errors == 0 ? "Verification PASSED" : "Verification FAILED") << std::endl;
        return observer->errors == 0 ? 0 : 1;
    }
    return 0;
}

#pragma once
// Delivery of collected plan batches
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "plan_record.hpp"

namespace harvest {

class PlanEventSink {
public:
    virtual ~PlanEventSink() = default;

    // One call per collection run, possibly with an empty batch
    virtual void submit(const std::vector<PlanRecord>& records,
                        const std::vector<std::string>& tags,
                        const std::string& source) = 0;
};

// JSON array of events: record body + ddsource, ddtags, timestamp (ms)
nlohmann::json build_event_batch(const std::vector<PlanRecord>& records,
                                 const std::vector<std::string>& tags,
                                 const std::string& source,
                                 int64_t timestamp_ms);

// POSTs batches to an HTTP intake. Without a URL (or in dry-run mode) the
// batch is only logged. Delivery failures are logged, never thrown.
class HttpEventSink : public PlanEventSink {
public:
    HttpEventSink(std::string intake_url, std::string api_key, bool dry_run = false)
        : intake_url_(std::move(intake_url)), api_key_(std::move(api_key)), dry_run_(dry_run) {}

    void submit(const std::vector<PlanRecord>& records,
                const std::vector<std::string>& tags,
                const std::string& source) override;

    [[nodiscard]] int64_t events_sent() const { return events_sent_; }

private:
    bool post(const std::string& body);

    std::string intake_url_;
    std::string api_key_;
    bool dry_run_;
    int64_t events_sent_ = 0;
};

} // namespace harvest

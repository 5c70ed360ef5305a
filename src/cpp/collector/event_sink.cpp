#include "event_sink.hpp"
#include "../utils/logger.hpp"
#include "../utils/timer.hpp"

#include <curl/curl.h>

namespace harvest {

static size_t write_cb(char* ptr, size_t size, size_t nmemb, std::string* data) {
    data->append(ptr, size * nmemb);
    return size * nmemb;
}

nlohmann::json build_event_batch(const std::vector<PlanRecord>& records,
                                 const std::vector<std::string>& tags,
                                 const std::string& source,
                                 int64_t timestamp_ms) {
    std::string joined;
    for (const auto& t : tags) {
        if (!joined.empty()) joined += ',';
        joined += t;
    }

    nlohmann::json batch = nlohmann::json::array();
    for (const auto& r : records) {
        nlohmann::json e = r.to_json();
        e["ddsource"] = source;
        e["ddtags"] = joined;
        e["timestamp"] = timestamp_ms;
        batch.push_back(std::move(e));
    }
    return batch;
}

void HttpEventSink::submit(const std::vector<PlanRecord>& records,
                           const std::vector<std::string>& tags,
                           const std::string& source) {
    if (records.empty()) {
        LOG_DBG("[sink] No execution plans to submit");
        return;
    }

    std::string body = build_event_batch(records, tags, source, now_ms()).dump();

    if (dry_run_ || intake_url_.empty()) {
        LOG_INF("[sink] %s%zu %s plan events (%zu bytes), not sent",
            dry_run_ ? "DRY RUN: " : "", records.size(), source.c_str(), body.size());
        LOG_DBG("[sink] %s", body.c_str());
        return;
    }

    if (post(body)) {
        events_sent_ += static_cast<int64_t>(records.size());
        LOG_DBG("[sink] Submitted %zu %s plan events", records.size(), source.c_str());
    }
}

bool HttpEventSink::post(const std::string& body) {
    CURL* curl = curl_easy_init();
    if (!curl) {
        LOG_ERR("[sink] curl_easy_init failed");
        return false;
    }

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::string key_header;
    if (!api_key_.empty()) {
        key_header = "DD-API-KEY: " + api_key_;
        headers = curl_slist_append(headers, key_header.c_str());
    }

    std::string response;
    curl_easy_setopt(curl, CURLOPT_URL, intake_url_.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 15L);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, 5L);

    CURLcode res = curl_easy_perform(curl);
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (res != CURLE_OK) {
        LOG_ERR("[sink] POST %s failed: %s", intake_url_.c_str(), curl_easy_strerror(res));
        return false;
    }
    if (status >= 300) {
        LOG_ERR("[sink] POST %s returned HTTP %ld: %s",
            intake_url_.c_str(), status, response.c_str());
        return false;
    }
    return true;
}

} // namespace harvest

#include "exchange_client.hpp"
#include "log.hpp"

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <cstdlib>
#include <utility>
#include <string>

static size_t write_cb(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* s = static_cast<std::string*>(userdata);
    s->append(ptr, size * nmemb);
    return size * nmemb;
}

static long connect_timeout_ms() {
    const char* v = std::getenv("HL_CONNECT_TIMEOUT_MS");
    if (!v || !*v) return 5000;
    char* end = nullptr;
    long ms = std::strtol(v, &end, 10);
    if (end == v || ms <= 0) return 5000;
    return ms;
}

static std::string error_json(const std::string& error, const std::string& msg) {
    nlohmann::json j;
    j["error"] = error;
    j["msg"] = msg;
    return j.dump();
}

ExchangeClient::ExchangeClient(std::string base_url)
: base_url_(std::move(base_url)) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

std::string ExchangeClient::post_action(const std::string& body_json) {
    return post("/exchange", body_json);
}

std::string ExchangeClient::post(const std::string& path, const std::string& body_json) {
    const std::string url = base_url_ + path;

    CURL* curl = curl_easy_init();
    if (!curl) return error_json("curl init failed", url);

    struct curl_slist* headers = nullptr;
    headers = curl_slist_append(headers, "Content-Type: application/json");

    std::string resp;
    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body_json.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)body_json.size());
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &resp);
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, connect_timeout_ms());

    // TLS verify ON
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    CURLcode rc = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    curl_slist_free_all(headers);
    curl_easy_cleanup(curl);

    if (rc != CURLE_OK) {
        log_line("ExchangeClient", std::string("POST ") + url + " failed: " + curl_easy_strerror(rc));
        return error_json("curl perform failed", curl_easy_strerror(rc));
    }
    if (http_code < 200 || http_code >= 300) {
        log_line("ExchangeClient", "POST " + url + " http " + std::to_string(http_code));
        return error_json("http " + std::to_string(http_code), resp);
    }
    return resp;
}

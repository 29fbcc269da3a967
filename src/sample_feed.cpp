#include "priceopt/sample_feed.hpp"
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <curl/curl.h>
#include <fstream>
#include <mutex>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

using json = nlohmann::json;

namespace priceopt {

// ── Text parsing ─────────────────────────────────────────────────────
static double parseNumber(const std::string &cleaned,
                          const std::string &original) {
  if (cleaned.empty())
    throw std::invalid_argument("no number in '" + original + "'");
  size_t used = 0;
  double v;
  try {
    v = std::stod(cleaned, &used);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument("number out of range '" + original + "'");
  }
  if (used != cleaned.size() || !std::isfinite(v))
    throw std::invalid_argument("malformed number '" + original + "'");
  return v;
}

double parsePriceText(const std::string &text) {
  std::string cleaned;
  for (char c : text) {
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '-')
      cleaned += c;
    else if (c == ',')
      cleaned += '.';
    // '.' thousands separators, currency and whitespace are dropped
  }
  return parseNumber(cleaned, text);
}

double parseRatingText(const std::string &text) {
  std::string cleaned;
  for (char c : text) {
    if (c == '(' || c == ')' || c == ',' ||
        std::isspace(static_cast<unsigned char>(c)))
      continue;
    cleaned += c;
  }
  return parseNumber(cleaned, text);
}

double imputeMissingRatings(std::vector<double> &ratings) {
  double sum = 0.0;
  size_t known = 0;
  for (double r : ratings) {
    if (r > 0.0) {
      sum += r;
      known++;
    }
  }
  double mean = known ? sum / static_cast<double>(known) : 0.0;
  for (double &r : ratings) {
    if (r == 0.0)
      r = mean;
  }
  return mean;
}

// ── Document parsing ─────────────────────────────────────────────────
static std::optional<double> readPrice(const json &v) {
  try {
    if (v.is_number())
      return v.get<double>();
    if (v.is_string())
      return parsePriceText(v.get<std::string>());
  } catch (const std::exception &e) {
    spdlog::debug("[Feed] Unreadable price: {}", e.what());
  }
  return std::nullopt;
}

static double readRating(const json &v) {
  try {
    if (v.is_number())
      return v.get<double>();
    if (v.is_string())
      return parseRatingText(v.get<std::string>());
  } catch (const std::exception &e) {
    spdlog::debug("[Feed] Unreadable rating: {}", e.what());
  }
  return 0.0;
}

static SampleBatch batchFromJson(const json &doc) {
  SampleBatch batch;
  if (!doc.is_object())
    throw std::runtime_error("sample document must be a JSON object");

  if (doc.contains("products")) {
    const auto &products = doc["products"];
    if (!products.is_array())
      throw std::runtime_error("'products' must be an array");
    batch.product_count = products.size();
    for (const auto &p : products) {
      if (!p.is_object() || !p.contains("price"))
        continue;
      auto price = readPrice(p["price"]);
      if (!price)
        continue;
      batch.prices.push_back(*price);
      batch.ratings.push_back(p.contains("rating") ? readRating(p["rating"])
                                                   : 0.0);
    }
  } else if (doc.contains("prices") && doc.contains("ratings")) {
    const auto &prices = doc["prices"];
    const auto &ratings = doc["ratings"];
    if (!prices.is_array() || !ratings.is_array())
      throw std::runtime_error("'prices' and 'ratings' must be arrays");
    // Unreadable entries stay in place as NaN so the two axes keep their
    // pairing; the estimator drops those rows.
    for (const auto &v : prices)
      batch.prices.push_back(readPrice(v).value_or(std::nan("")));
    for (const auto &v : ratings)
      batch.ratings.push_back(readRating(v));
    batch.product_count = batch.prices.size();
  } else {
    throw std::runtime_error(
        "sample document needs 'products' or 'prices'/'ratings'");
  }

  batch.mean_rating = imputeMissingRatings(batch.ratings);
  return batch;
}

SampleBatch parseSampleDocument(const std::string &raw) {
  return batchFromJson(json::parse(raw));
}

// ── JSON file source ─────────────────────────────────────────────────
JsonFileSampleSource::JsonFileSampleSource(const std::string &path)
    : path_(path) {}

SampleBatch JsonFileSampleSource::fetch(const std::string &product_name) {
  try {
    std::ifstream in(path_);
    if (!in.is_open())
      throw std::runtime_error("cannot open " + path_);
    json doc = json::parse(in);

    if (doc.is_object() && doc.contains("catalog")) {
      const auto &catalog = doc["catalog"];
      if (!catalog.is_object() || !catalog.contains(product_name)) {
        spdlog::warn("[Feed] '{}' not in catalog {}", product_name, path_);
        return {};
      }
      doc = catalog[product_name];
    }

    auto batch = batchFromJson(doc);
    spdlog::info("[Feed] Loaded {} samples for '{}' from {} (mean rating "
                 "{:.2f})",
                 batch.prices.size(), product_name, path_, batch.mean_rating);
    return batch;
  } catch (const std::exception &e) {
    spdlog::error("[Feed] Error reading {}: {}", path_, e.what());
  }
  return {};
}

std::vector<std::string> JsonFileSampleSource::catalogProducts() const {
  std::vector<std::string> names;
  try {
    std::ifstream in(path_);
    if (!in.is_open())
      throw std::runtime_error("cannot open " + path_);
    json doc = json::parse(in);
    if (doc.is_object() && doc.contains("catalog") &&
        doc["catalog"].is_object()) {
      for (auto it = doc["catalog"].begin(); it != doc["catalog"].end(); ++it)
        names.push_back(it.key());
    }
  } catch (const std::exception &e) {
    spdlog::error("[Feed] Error reading {}: {}", path_, e.what());
  }
  return names;
}

// ── HTTP source ──────────────────────────────────────────────────────
static size_t writeCallback(char *data, size_t size, size_t nmemb,
                            void *userp) {
  auto *buf = static_cast<std::string *>(userp);
  buf->append(data, size * nmemb);
  return size * nmemb;
}

static std::once_flag curl_init_flag;
static void initCurlOnce() {
  curl_global_init(CURL_GLOBAL_DEFAULT);
  std::atexit(curl_global_cleanup);
}

HttpSampleSource::HttpSampleSource(const Config &config)
    : baseUrl_(config.source_url), timeout_s_(config.http_timeout_s) {
  std::call_once(curl_init_flag, initCurlOnce);
}

HttpSampleSource::~HttpSampleSource() {
  // cleanup handled by atexit registered in initCurlOnce
}

std::string HttpSampleSource::searchUrl(const std::string &product_name) const {
  CURL *curl = curl_easy_init();
  if (!curl)
    throw std::runtime_error("Failed to init curl");
  char *escaped = curl_easy_escape(curl, product_name.c_str(),
                                   static_cast<int>(product_name.size()));
  std::string query = escaped ? escaped : "";
  curl_free(escaped);
  curl_easy_cleanup(curl);

  char sep = baseUrl_.find('?') == std::string::npos ? '?' : '&';
  return baseUrl_ + sep + "q=" + query;
}

std::string HttpSampleSource::httpGet(const std::string &url) {
  CURL *curl = curl_easy_init();
  if (!curl)
    throw std::runtime_error("Failed to init curl");

  std::string response;
  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_s_);
  curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

  struct curl_slist *headers = nullptr;
  headers = curl_slist_append(headers, "Accept: application/json");
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);

  CURLcode res = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  curl_slist_free_all(headers);
  curl_easy_cleanup(curl);

  if (res != CURLE_OK) {
    throw std::runtime_error(std::string("HTTP GET failed: ") +
                             curl_easy_strerror(res));
  }
  if (status >= 400)
    throw std::runtime_error("HTTP GET returned status " +
                             std::to_string(status));
  return response;
}

SampleBatch HttpSampleSource::fetch(const std::string &product_name) {
  spdlog::info("[Feed] Searching for '{}'...", product_name);
  try {
    auto raw = httpGet(searchUrl(product_name));
    auto batch = parseSampleDocument(raw);
    spdlog::info("[Feed] Fetched {} listings, {} usable samples (mean rating "
                 "{:.2f})",
                 batch.product_count, batch.prices.size(), batch.mean_rating);
    return batch;
  } catch (const std::exception &e) {
    spdlog::error("[Feed] Error during product search: {}", e.what());
  }
  return {};
}

} // namespace priceopt

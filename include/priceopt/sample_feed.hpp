#pragma once
#include "priceopt/common.hpp"
#include <string>

namespace priceopt {

// "1.299,90 TL" -> 1299.90 ('.' groups thousands, ',' is the decimal mark).
// Throws std::invalid_argument when no number can be read.
double parsePriceText(const std::string &text);

// "(1,234)" -> 1234. Throws std::invalid_argument when no number is left.
double parseRatingText(const std::string &text);

// Replace zero (missing) ratings with the mean of the positive ones.
// Returns that mean, 0 when no rating is positive.
double imputeMissingRatings(std::vector<double> &ratings);

// Parse a sample document:
//   {"products": [{"price": 129.9 | "129,90 TL", "rating": 12 | "(12)"}, ...]}
// or
//   {"prices": [...], "ratings": [...]}
// Listings without a readable price are skipped, unreadable ratings become 0.
// Ratings are imputed before returning. Throws on malformed JSON.
SampleBatch parseSampleDocument(const std::string &raw);

// Supplier of raw (price, rating) samples for a named product.
class SampleSource {
public:
  virtual ~SampleSource() = default;

  // Empty batch when nothing could be retrieved.
  virtual SampleBatch fetch(const std::string &product_name) = 0;
};

// Reads a sample document from disk. A top-level "catalog" object maps
// product names to documents; without one the whole file is used for every
// product.
class JsonFileSampleSource : public SampleSource {
public:
  explicit JsonFileSampleSource(const std::string &path);

  SampleBatch fetch(const std::string &product_name) override;

  // Keys of the "catalog" object, sorted by name. Empty when the file has no
  // catalog or cannot be read.
  std::vector<std::string> catalogProducts() const;

private:
  std::string path_;
};

// GETs <base_url>?q=<product> and parses the body as a sample document.
class HttpSampleSource : public SampleSource {
public:
  explicit HttpSampleSource(const Config &config);
  ~HttpSampleSource() override;

  SampleBatch fetch(const std::string &product_name) override;

  std::string searchUrl(const std::string &product_name) const;

private:
  std::string baseUrl_;
  long timeout_s_;

  std::string httpGet(const std::string &url);
};

} // namespace priceopt

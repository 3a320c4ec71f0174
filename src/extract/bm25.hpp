#pragma once
#include <string>
#include <unordered_map>
#include <vector>

namespace Trawl {
namespace Extract {

// Okapi BM25 over a fixed corpus of tokenized documents. Terms whose idf would
// be negative get epsilon times the mean idf instead.
class Bm25 {
public:
    static constexpr double DEFAULT_K1      = 1.5;
    static constexpr double DEFAULT_B       = 0.75;
    static constexpr double DEFAULT_EPSILON = 0.25;

    explicit Bm25(const std::vector<std::vector<std::string>>& corpus,
                  double                                      k1      = DEFAULT_K1,
                  double                                      b       = DEFAULT_B,
                  double                                      epsilon = DEFAULT_EPSILON);

    std::vector<double> scores(const std::vector<std::string>& query) const;
    double              idf(const std::string& term) const;

private:
    double k1_;
    double b_;
    double avgdl_ = 0.0;

    std::vector<std::unordered_map<std::string, int>> term_freqs_;
    std::vector<std::size_t>                          doc_lengths_;
    std::unordered_map<std::string, double>           idf_;
};

}  // namespace Extract
}  // namespace Trawl

#include "bm25.hpp"
#include <cmath>

namespace Trawl {
namespace Extract {

Bm25::Bm25(const std::vector<std::vector<std::string>>& corpus, double k1, double b, double epsilon)
    : k1_(k1), b_(b) {
    std::unordered_map<std::string, int> doc_freq;
    std::size_t                          total_length = 0;

    for (const auto& doc : corpus) {
        std::unordered_map<std::string, int> freqs;
        for (const auto& term : doc)
            ++freqs[term];
        for (const auto& [term, count] : freqs)
            ++doc_freq[term];
        term_freqs_.push_back(std::move(freqs));
        doc_lengths_.push_back(doc.size());
        total_length += doc.size();
    }
    if (corpus.empty())
        return;

    avgdl_ = static_cast<double>(total_length) / static_cast<double>(corpus.size());

    const double             n        = static_cast<double>(corpus.size());
    double                   idf_sum  = 0.0;
    std::vector<std::string> negative;
    for (const auto& [term, freq] : doc_freq) {
        double value = std::log(n - freq + 0.5) - std::log(freq + 0.5);
        idf_[term]   = value;
        idf_sum += value;
        if (value < 0)
            negative.push_back(term);
    }

    const double floor = epsilon * (idf_sum / static_cast<double>(idf_.size()));
    for (const auto& term : negative)
        idf_[term] = floor;
}

double Bm25::idf(const std::string& term) const {
    auto it = idf_.find(term);
    return it != idf_.end() ? it->second : 0.0;
}

std::vector<double> Bm25::scores(const std::vector<std::string>& query) const {
    std::vector<double> result(term_freqs_.size(), 0.0);
    if (avgdl_ <= 0.0)
        return result;

    for (const auto& term : query) {
        double term_idf = idf(term);
        for (std::size_t i = 0; i < term_freqs_.size(); ++i) {
            auto it = term_freqs_[i].find(term);
            if (it == term_freqs_[i].end())
                continue;
            double tf   = it->second;
            double norm = 1.0 - b_ + b_ * static_cast<double>(doc_lengths_[i]) / avgdl_;
            result[i] += term_idf * (tf * (k1_ + 1.0)) / (tf + k1_ * norm);
        }
    }
    return result;
}

}  // namespace Extract
}  // namespace Trawl

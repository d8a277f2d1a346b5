#include "competix/embedding_fuser.hpp"
#include "competix/errors.hpp"
#include "competix/log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <exception>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace competix {

namespace {

constexpr size_t kNoText = static_cast<size_t>(-1);

// Returns false when v has no direction.
bool unit_into(const std::vector<float>& v, std::vector<double>& out) {
    double n = 0.0;
    for (float x : v) n += static_cast<double>(x) * x;
    if (!(n > 0.0) || !std::isfinite(n)) return false;
    double inv = 1.0 / std::sqrt(n);
    out.resize(v.size());
    for (size_t j = 0; j < v.size(); ++j) out[j] = v[j] * inv;
    return true;
}

}  // namespace

EmbeddingFuser::EmbeddingFuser(EmbeddingConfig cfg, const IEmbeddingModel& model)
    : cfg_(cfg), model_(model) {
    cfg_.validate();
    if (model_.dim() == 0)
        throw std::invalid_argument("EmbeddingFuser: model reports dim 0");
}

std::vector<std::vector<float>> EmbeddingFuser::encode_with_retry(
    const std::vector<std::string>& batch, size_t batch_idx) const {
    auto delay = std::chrono::duration<double, std::milli>(cfg_.backoff_initial_ms);

    for (uint32_t attempt = 1;; ++attempt) {
        std::vector<std::vector<float>> out;
        try {
            out = model_.encode(batch);
        } catch (const std::exception& e) {
            if (attempt >= cfg_.max_attempts) {
                throw EmbeddingError("embedding batch " + std::to_string(batch_idx) +
                                     " failed after " + std::to_string(attempt) +
                                     " attempts: " + e.what());
            }
            CX_WARN("embed", "batch %zu attempt %u/%u failed: %s; retrying in %.0fms",
                    batch_idx, attempt, cfg_.max_attempts, e.what(), delay.count());
            std::this_thread::sleep_for(delay);
            delay *= cfg_.backoff_multiplier;
            continue;
        }

        if (out.size() != batch.size()) {
            throw EmbeddingError("embedding batch " + std::to_string(batch_idx) +
                                 ": model returned " + std::to_string(out.size()) +
                                 " vectors for " + std::to_string(batch.size()) +
                                 " texts");
        }
        for (const auto& v : out) {
            if (v.size() != model_.dim())
                throw DimensionMismatchError(model_.dim(), v.size());
        }
        return out;
    }
}

std::vector<std::vector<float>> EmbeddingFuser::encode_all(
    const std::vector<std::string>& texts) const {
    std::vector<std::vector<float>> out(texts.size());
    if (texts.empty()) return out;

    const size_t bs = cfg_.batch_size;
    const size_t num_batches = (texts.size() + bs - 1) / bs;
    const size_t num_threads =
        std::min<size_t>(cfg_.num_workers, num_batches);

    std::atomic<size_t> next_batch{0};
    std::atomic<bool> failed{false};
    std::mutex err_mu;
    std::exception_ptr first_error;

    auto worker = [&]() {
        for (;;) {
            size_t b = next_batch.fetch_add(1, std::memory_order_relaxed);
            if (b >= num_batches || failed.load(std::memory_order_acquire)) return;

            size_t start = b * bs;
            size_t end = std::min(texts.size(), start + bs);
            std::vector<std::string> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                           texts.begin() + static_cast<std::ptrdiff_t>(end));
            try {
                auto vecs = encode_with_retry(batch, b);
                for (size_t i = 0; i < vecs.size(); ++i)
                    out[start + i] = std::move(vecs[i]);
            } catch (...) {
                std::lock_guard<std::mutex> lk(err_mu);
                if (!first_error) first_error = std::current_exception();
                failed.store(true, std::memory_order_release);
                return;
            }
            CX_DEBUG("embed", "batch %zu/%zu done", b + 1, num_batches);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (size_t t = 0; t < num_threads; ++t) threads.emplace_back(worker);
    for (auto& t : threads) t.join();

    if (first_error) std::rethrow_exception(first_error);
    return out;
}

FusedEmbeddings EmbeddingFuser::fuse(
    const std::vector<Company>& companies,
    const std::vector<NormalizedCompany>& normalized) const {
    if (companies.size() != normalized.size())
        throw std::invalid_argument("EmbeddingFuser::fuse: companies and normalized text differ in length");

    FusedEmbeddings result;
    result.model_id = model_.id();
    result.dim = model_.dim();

    // Distinct texts -> slot in the encode list.
    std::vector<std::string> texts;
    std::unordered_map<std::string, size_t> text_slot;
    auto slot_for = [&](const std::string& t) -> size_t {
        if (t.empty()) return kNoText;
        auto [it, inserted] = text_slot.emplace(t, texts.size());
        if (inserted) texts.push_back(t);
        return it->second;
    };

    struct Pending { size_t row; size_t product; size_t customers; };
    std::vector<Pending> pending;
    pending.reserve(companies.size());
    std::unordered_set<std::string> seen_ids;

    for (size_t r = 0; r < companies.size(); ++r) {
        const auto& n = normalized[r];
        if (n.row != r)
            throw std::invalid_argument("EmbeddingFuser::fuse: normalized rows out of order");
        if (!seen_ids.insert(companies[r].id).second) {
            result.excluded.push_back({r, companies[r].id, ExclusionReason::DuplicateIdentifier});
            continue;
        }
        if (!n.has_product() && !n.has_customers()) {
            result.excluded.push_back({r, companies[r].id, ExclusionReason::EmptyDescriptions});
            continue;
        }
        pending.push_back({r, slot_for(n.product), slot_for(n.customers)});
    }

    CX_INFO("embed", "encoding %zu distinct texts for %zu companies (model=%s, batch=%zu, workers=%u)",
            texts.size(), pending.size(), result.model_id.c_str(),
            cfg_.batch_size, cfg_.num_workers);

    auto vecs = encode_all(texts);

    const size_t dim = result.dim;
    const double alpha = cfg_.alpha;
    result.rows.reserve(pending.size());
    result.ids.reserve(pending.size());
    result.data.reserve(pending.size() * dim);

    std::vector<double> p, c, f(dim);
    std::vector<Exclusion> degenerate;
    for (const auto& item : pending) {
        bool has_p = item.product != kNoText && unit_into(vecs[item.product], p);
        bool has_c = item.customers != kNoText && unit_into(vecs[item.customers], c);

        if (has_p && has_c) {
            for (size_t j = 0; j < dim; ++j) f[j] = alpha * p[j] + (1.0 - alpha) * c[j];
        } else if (has_p) {
            f = p;
        } else if (has_c) {
            f = c;
        } else {
            degenerate.push_back({item.row, companies[item.row].id,
                                  ExclusionReason::DegenerateEmbedding});
            continue;
        }

        double n2 = 0.0;
        for (double x : f) n2 += x * x;
        if (!(n2 > 1e-24)) {
            degenerate.push_back({item.row, companies[item.row].id,
                                  ExclusionReason::DegenerateEmbedding});
            continue;
        }
        double inv = 1.0 / std::sqrt(n2);
        for (double x : f) result.data.push_back(static_cast<float>(x * inv));
        result.rows.push_back(item.row);
        result.ids.push_back(companies[item.row].id);
    }

    if (!degenerate.empty()) {
        result.excluded.insert(result.excluded.end(), degenerate.begin(), degenerate.end());
        std::sort(result.excluded.begin(), result.excluded.end(),
                  [](const Exclusion& a, const Exclusion& b) { return a.row < b.row; });
    }

    CX_INFO("embed", "fused %zu embeddings (dim=%zu, alpha=%.3f), excluded %zu",
            result.size(), dim, alpha, result.excluded.size());
    return result;
}

}  // namespace competix

#include "app/JobMerger.hpp"

#include <QString>

#include <unordered_map>

namespace jh::client::app {

using domain::Job;

namespace {

template <typename T>
void mergeOptional(std::optional<T>& dst, const std::optional<T>& in) {
    if (in.has_value()) {
        dst = in;
    }
}

QString normalizedText(const std::string& s) {
    return QString::fromStdString(s).toLower().simplified();
}

} // namespace

std::string JobMerger::signature(const Job& job) {
    return (normalizedText(job.company) + QStringLiteral("||") + normalizedText(job.title))
        .toStdString();
}

std::string JobMerger::normalizedUrl(const Job& job) {
    return QString::fromStdString(job.url).trimmed().toLower().toStdString();
}

void JobMerger::overwrite(Job& dst, const Job& in) {
    dst.title          = in.title;
    dst.company        = in.company;
    dst.location       = in.location;
    dst.platform       = in.platform;
    dst.url            = in.url;
    dst.relevanceScore = in.relevanceScore;
    dst.applied        = in.applied;

    mergeOptional(dst.mlScore, in.mlScore);
    mergeOptional(dst.combinedScore, in.combinedScore);
    mergeOptional(dst.ampel, in.ampel);
    mergeOptional(dst.hidden, in.hidden);
    mergeOptional(dst.datePosted, in.datePosted);
    mergeOptional(dst.firstSeen, in.firstSeen);
    mergeOptional(dst.isNewSinceLastSearch, in.isNewSinceLastSearch);
    mergeOptional(dst.description, in.description);
    mergeOptional(dst.salaryInfo, in.salaryInfo);
}

std::vector<Job> JobMerger::merge(const std::vector<Job>& existing,
                                  const std::vector<Job>& incoming,
                                  MergeStats* stats) {
    MergeStats local;
    MergeStats& st = stats ? *stats : local;
    st = MergeStats{};

    std::vector<Job> merged = existing;

    // Indices point into `merged`; it only grows by push_back at the end,
    // so positions stay valid.
    std::unordered_map<std::string, std::size_t> byId;
    std::unordered_map<std::string, std::size_t> byUrl;
    std::unordered_map<std::string, std::size_t> bySignature;

    const auto index = [&](std::size_t pos) {
        const Job& job = merged[pos];
        byId.emplace(job.id, pos);
        const auto url = normalizedUrl(job);
        if (!url.empty()) {
            byUrl.emplace(url, pos);
        }
        bySignature.emplace(signature(job), pos);
    };

    for (std::size_t i = 0; i < merged.size(); ++i) {
        index(i);
    }

    const auto unindexKeys = [&](std::size_t pos) {
        const Job& job = merged[pos];
        if (const auto it = byUrl.find(normalizedUrl(job)); it != byUrl.end() && it->second == pos) {
            byUrl.erase(it);
        }
        if (const auto it = bySignature.find(signature(job)); it != bySignature.end() && it->second == pos) {
            bySignature.erase(it);
        }
    };

    const auto heldByOther = [](const std::unordered_map<std::string, std::size_t>& keys,
                                const std::string& key, std::size_t pos) {
        const auto it = keys.find(key);
        return it != keys.end() && it->second != pos;
    };

    for (const auto& in : incoming) {
        if (const auto it = byId.find(in.id); it != byId.end()) {
            const std::size_t pos = it->second;
            const auto url = normalizedUrl(in);
            const bool keysCollide = (!url.empty() && heldByOther(byUrl, url, pos)) ||
                                     heldByOther(bySignature, signature(in), pos);

            Job& dst = merged[pos];
            if (keysCollide) {
                // New url or company/title belong to another record: keep the
                // old key fields, take everything else.
                const std::string oldUrl     = dst.url;
                const std::string oldTitle   = dst.title;
                const std::string oldCompany = dst.company;
                overwrite(dst, in);
                dst.url     = oldUrl;
                dst.title   = oldTitle;
                dst.company = oldCompany;
                ++st.keptKeyFields;
            } else {
                unindexKeys(pos);
                overwrite(dst, in);
                index(pos);
            }
            ++st.updated;
            continue;
        }

        const auto url = normalizedUrl(in);
        if (!url.empty() && byUrl.count(url) > 0) {
            ++st.skippedByUrl;
            continue;
        }

        if (bySignature.count(signature(in)) > 0) {
            ++st.skippedBySignature;
            continue;
        }

        merged.push_back(in);
        index(merged.size() - 1);
        ++st.added;
    }

    return merged;
}

bool JobMerger::collidesWithAny(const std::vector<Job>& jobs, const Job& job) {
    const auto url = normalizedUrl(job);
    const auto sig = signature(job);
    for (const auto& other : jobs) {
        if (other.id == job.id || signature(other) == sig ||
            (!url.empty() && normalizedUrl(other) == url)) {
            return true;
        }
    }
    return false;
}

std::vector<Job> JobMerger::removeDuplicates(const std::vector<Job>& jobs, MergeStats* stats) {
    return merge({}, jobs, stats);
}

} // namespace jh::client::app

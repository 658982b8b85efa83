#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace jh::client::domain {

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using JobId     = std::string;

// --- Ampel (traffic-light triage) -------------------------------------------

enum class AmpelColor {
    Green  = 0,
    Yellow = 1,
    Red    = 2
};

struct Ampel {
    AmpelColor  color{AmpelColor::Yellow};
    std::string label;
    int         priority{0};
    double      percentile{0.0};
    std::string tier; // "score_tier" on the wire
};

// --- Job --------------------------------------------------------------------

struct Job {
    JobId       id;
    std::string title;
    std::string company;
    std::string location;
    std::string platform;
    std::string url;
    double      relevanceScore{0.0};

    std::optional<double> mlScore;
    std::optional<double> combinedScore;
    std::optional<Ampel>  ampel;

    bool                  applied{false};
    std::optional<bool>   hidden;

    std::optional<std::string> datePosted;
    std::optional<std::string> firstSeen;
    std::optional<bool>        isNewSinceLastSearch;

    std::optional<std::string> description;
    std::optional<std::string> salaryInfo;

    bool isHidden() const noexcept {
        return hidden.value_or(false);
    }
};

// --- Application status ------------------------------------------------------

// Whether a draft letter exists for a job (matched by company and title on the
// drafts service side).
struct ApplicationStatus {
    bool                       hasApplication{false};
    std::optional<std::string> applicationDate;
    std::optional<std::string> draftId;
};

using ApplicationStatusMap = std::map<JobId, ApplicationStatus>;

// --- Generated applications (drafted letters) -------------------------------

struct GeneratedApplication {
    int         jobId{0};
    std::string jobTitle;
    std::string company;
    std::string applicationText;
    std::string filename;
    std::string filePath;

    std::optional<std::string> pdfPath;
    std::optional<std::string> foundAddress;
    bool                       addressAvailable{false};
};

// What the approval dialog hands back for a single application.
struct ApprovalItem {
    int                        jobId{0};
    std::optional<std::string> applicationText;
    std::optional<std::string> companyAddress;
    std::optional<bool>        forcePdf;

    // Only used by the offline drafts path.
    std::string company;
    std::string jobTitle;
};

// --- Search configuration ---------------------------------------------------

struct ProviderToggles {
    bool jsearch{true};
    bool adzuna{true};
    bool stepstone{false};
};

struct AgeFilter {
    bool enabled{false};
    int  maxDays{30};
};

struct RunConfig {
    std::string     jobTitle;
    std::string     searchTerms;
    std::string     location;
    bool            remote{false};
    int             maxJobs{15};
    int             jobAgeDays{30};
    AgeFilter       ageFilter;
    ProviderToggles providers;
};

inline RunConfig defaultRunConfig() {
    return RunConfig{};
}

// --- Storage retention ------------------------------------------------------

struct Retention {
    static constexpr int kUnlimitedDays = -1;
    static constexpr int kDefaultDays   = 7;

    int days{kDefaultDays};

    static Retention unlimited() { return Retention{kUnlimitedDays}; }
    static Retention ofDays(int d) { return Retention{d}; }

    bool isUnlimited() const noexcept { return days < 0; }

    bool operator==(const Retention& other) const noexcept { return days == other.days; }
    bool operator!=(const Retention& other) const noexcept { return days != other.days; }
};

struct RetentionOption {
    const char* label;
    int         days;
};

// Choices offered to the user, in display order.
inline const std::vector<RetentionOption>& retentionOptions() {
    static const std::vector<RetentionOption> options{
        {"1 day", 1},
        {"3 days", 3},
        {"1 week", 7},
        {"2 weeks", 14},
        {"1 month", 30},
        {"3 months", 90},
        {"Unlimited", Retention::kUnlimitedDays},
    };
    return options;
}

// --- Confirmation gating ----------------------------------------------------

enum class ConfirmationKind {
    DeleteJob = 0
};

struct ConfirmationRequest {
    ConfirmationKind kind{ConfirmationKind::DeleteJob};
    JobId            jobId;
    std::string      label;
};

// --- Helpers ----------------------------------------------------------------

inline std::string to_string(AmpelColor c) {
    switch (c) {
        case AmpelColor::Green:  return "green";
        case AmpelColor::Yellow: return "yellow";
        case AmpelColor::Red:    return "red";
    }
    return "yellow";
}

inline std::optional<AmpelColor> ampelColorFromString(const std::string& s) {
    if (s == "green")  return AmpelColor::Green;
    if (s == "yellow") return AmpelColor::Yellow;
    if (s == "red")    return AmpelColor::Red;
    return std::nullopt;
}

inline std::string to_string(const Retention& r) {
    if (r.isUnlimited()) {
        return "unlimited";
    }
    return std::to_string(r.days) + " days";
}

} // namespace jh::client::domain

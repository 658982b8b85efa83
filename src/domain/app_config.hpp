#pragma once

#include <string>

namespace jh::client::domain {

// --- Worker -----------------------------------------------------------------

struct WorkerSettings {
    std::string program{"python3"};
    std::string script{"job_hunter_ultimate.py"};
    std::string workingDirectory;  // empty: application directory
    std::string killPattern;       // pkill -f pattern; empty: script name
};

// --- Application config -----------------------------------------------------

struct AppConfig {
    WorkerSettings worker;

    // Local companion service that relays decisions to the worker.
    std::string handshakeBaseUrl{"http://localhost:8000"};
    // Directory the worker polls for the file fallback; empty: system temp.
    std::string handshakeFallbackDir;

    std::string draftsUrl{"http://localhost:8000/drafts"};
    std::string jobCacheUrl{"http://localhost:5002/api/jobs"};
    std::string profileName{"default_profile"};

    // SQLite file for persisted jobs; relative paths resolve against the
    // application directory.
    std::string databasePath{"jobhunter.sqlite"};
};

} // namespace jh::client::domain

// Every tunable of the transfer engine in one place, with defaults,
// validation and QSettings persistence.
#pragma once
#include "RetryPolicy.hpp"
#include "scpflow/ChunkedTransfer.hpp"
#include "scpflow/CompressionStrategy.hpp"
#include "scpflow/DeltaSyncPlanner.hpp"
#include "scpflow/IntegrityVerifier.hpp"
#include "scpflow/SessionPool.hpp"

#include <string>

class QSettings;

namespace scpflow {

struct EngineSettings {
    // Tasks running at once.
    int maxConcurrent = 2;

    ConnectSettings connect;
    PoolSettings pool;
    ChunkSettings chunks;
    CompressionSettings compression;
    VerifySettings verification;
    SyncOptions sync;
    RetryPolicy retry;

    bool validate(std::string& err) const;

    // Missing keys keep their defaults.
    static EngineSettings load(QSettings& s);
    void save(QSettings& s) const;
};

} // namespace scpflow

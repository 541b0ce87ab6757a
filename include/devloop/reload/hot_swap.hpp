#pragma once

/// @file hot_swap.hpp
/// @brief Decides whether changed units can be redefined in the running process

#include <devloop/core/error.hpp>
#include <devloop/reload/dev_context.hpp>
#include <devloop/reload/reload_session.hpp>
#include <devloop/reload/scan_result.hpp>
#include <devloop/reload/structural_index.hpp>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace devloop_reload {

/// One compiled unit handed to the live redefinition facility
struct RedefinitionRequest {
    std::string unit_name;
    std::filesystem::path unit_path;
    std::vector<std::string> type_names;
    Bytes bytes;
};

/// The in-process facility that swaps code without a restart
class LiveRedefinition {
public:
    virtual ~LiveRedefinition() = default;

    [[nodiscard]] virtual bool is_available() const = 0;

    [[nodiscard]] virtual devloop_core::Result<void> redefine(const std::vector<RedefinitionRequest>& requests) = 0;
};

/// Rewrites unit bytes before redefinition (unit name, bytes) -> bytes
using UnitTransformer = std::function<Bytes(const std::string&, Bytes)>;

/// Returns true to veto a swap involving this type
using TypeVeto = std::function<bool(const TypeShape&)>;

/// Returns true to veto a swap for this index of changed types
using IndexVeto = std::function<bool(const StructuralIndex&)>;

/// Preconditions that come from the scan rather than the session
struct HotSwapContext {
    bool config_restart_needed = false;
    DevModeType dev_mode_type = DevModeType::Local;
};

class HotSwapEngine {
public:
    HotSwapEngine(std::shared_ptr<UnitIndexer> indexer, std::shared_ptr<LiveRedefinition> redefinition);

    void add_type_veto(TypeVeto veto);
    void add_index_veto(IndexVeto veto);
    void set_unit_transformer(UnitTransformer transformer);

    /// Facility present, baseline index present, no config restart, not the
    /// remote local side, instrumentation enabled
    [[nodiscard]] bool can_attempt(const ReloadSession& session, const HotSwapContext& context) const;

    /// Only changed units, at least one of them
    [[nodiscard]] static bool is_candidate(const ScanResult& result);

    /// Index, compare and redefine. Errs with a HotSwapError on rejection.
    [[nodiscard]] devloop_core::Result<void> try_swap(const ScanResult& result, const ReloadSession& session);

    /// Full decision: true only if the units were redefined. Never throws.
    bool attempt(const ScanResult& result, const ReloadSession& session, const HotSwapContext& context);

    [[nodiscard]] bool has_facility() const { return m_redefinition != nullptr; }

private:
    std::shared_ptr<UnitIndexer> m_indexer;
    std::shared_ptr<LiveRedefinition> m_redefinition;
    std::vector<TypeVeto> m_type_vetoes;
    std::vector<IndexVeto> m_index_vetoes;
    UnitTransformer m_transformer;
};

} // namespace devloop_reload

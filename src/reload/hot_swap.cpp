/// @file hot_swap.cpp
/// @brief HotSwapEngine implementation

#include <devloop/reload/hot_swap.hpp>
#include <devloop/core/log.hpp>

#include <exception>
#include <fstream>
#include <iterator>

namespace devloop_reload {

namespace fs = std::filesystem;

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::HotSwapError;
using devloop_core::Ok;
using devloop_core::Result;

HotSwapEngine::HotSwapEngine(std::shared_ptr<UnitIndexer> indexer, std::shared_ptr<LiveRedefinition> redefinition)
    : m_indexer(std::move(indexer))
    , m_redefinition(std::move(redefinition)) {}

void HotSwapEngine::add_type_veto(TypeVeto veto) {
    m_type_vetoes.push_back(std::move(veto));
}

void HotSwapEngine::add_index_veto(IndexVeto veto) {
    m_index_vetoes.push_back(std::move(veto));
}

void HotSwapEngine::set_unit_transformer(UnitTransformer transformer) {
    m_transformer = std::move(transformer);
}

bool HotSwapEngine::can_attempt(const ReloadSession& session, const HotSwapContext& context) const {
    return m_redefinition && m_indexer && m_redefinition->is_available()
        && session.last_start_index() != nullptr
        && !context.config_restart_needed
        && context.dev_mode_type != DevModeType::RemoteLocalSide
        && session.instrumentation_enabled();
}

bool HotSwapEngine::is_candidate(const ScanResult& result) {
    return result.added_units.empty() && result.deleted_units.empty() && !result.changed_units.empty();
}

Result<void> HotSwapEngine::try_swap(const ScanResult& result, const ReloadSession& session) {
    auto baseline = session.last_start_index();
    if (!baseline) {
        return Err(Error(HotSwapError::no_baseline()));
    }

    StructuralIndex current;
    std::vector<RedefinitionRequest> requests;

    for (const auto& unit_path : result.changed_units) {
        std::ifstream in(unit_path, std::ios::binary);
        if (!in) {
            return Err(Error(HotSwapError::index_failed(unit_path.string(), "cannot read unit")));
        }
        Bytes bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

        // The baseline knows the name each unit path was indexed under; a
        // unit it never saw is named by its longest matching relative name
        std::string unit_name;
        if (const std::string* indexed = baseline->unit_name_for(unit_path)) {
            unit_name = *indexed;
        } else {
            const std::string path = unit_path.generic_string();
            for (const auto& name : result.changed_names) {
                if (path.size() >= name.size()
                    && path.compare(path.size() - name.size(), name.size(), name) == 0
                    && name.size() > unit_name.size()) {
                    unit_name = name;
                }
            }
            if (unit_name.empty()) {
                unit_name = unit_path.filename().generic_string();
            }
        }

        auto shapes = m_indexer->index_unit(unit_name, bytes);
        if (!shapes) {
            return Err(shapes.error());
        }

        RedefinitionRequest request;
        request.unit_name = unit_name;
        request.unit_path = unit_path;
        for (const auto& shape : *shapes) {
            current.add(shape);
            request.type_names.push_back(shape.name);
        }
        request.bytes = m_transformer ? m_transformer(unit_name, std::move(bytes)) : std::move(bytes);
        requests.push_back(std::move(request));
    }

    for (const auto& veto : m_index_vetoes) {
        if (veto(current)) {
            return Err(Error(HotSwapError::vetoed({})));
        }
    }

    for (const auto& [key, shape] : current.types()) {
        const TypeShape* old = baseline->find(shape.unit, shape.name);
        if (!old || !old->same_structure(shape)) {
            return Err(Error(HotSwapError::structure_changed(shape.name)));
        }
        for (const auto& veto : m_type_vetoes) {
            if (veto(shape)) {
                return Err(Error(HotSwapError::vetoed(shape.name)));
            }
        }
    }

    // A type that disappeared from a changed unit is a structural change too
    for (const auto& request : requests) {
        for (const auto* old : baseline->types_in_unit(request.unit_name)) {
            if (!current.find(old->unit, old->name)) {
                return Err(Error(HotSwapError::structure_changed(old->name)));
            }
        }
    }

    devloop_core::hot_swap_logger()->info("Application restart not required, redefining {} unit(s)", requests.size());
    auto redefined = m_redefinition->redefine(requests);
    if (!redefined) {
        return Err(Error(HotSwapError::redefine_failed(redefined.error().message())));
    }
    return Ok();
}

bool HotSwapEngine::attempt(const ScanResult& result, const ReloadSession& session, const HotSwapContext& context) {
    if (!can_attempt(session, context) || !is_candidate(result)) {
        return false;
    }

    try {
        auto swapped = try_swap(result, session);
        if (!swapped) {
            const auto& error = swapped.error();
            if (error.code() == devloop_core::ErrorCode::Rejected) {
                devloop_core::hot_swap_logger()->debug("Hot swap rejected: {}", error.message());
            } else {
                devloop_core::hot_swap_logger()->error("Failed to redefine units: {}",
                    devloop_core::build_error_chain(error));
            }
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        devloop_core::hot_swap_logger()->error("Failed to redefine units: {}", e.what());
        return false;
    }
}

} // namespace devloop_reload

/// @file element.cpp
/// @brief Element implementations

#include <devloop/layer/element.hpp>
#include <devloop/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <array>
#include <cstring>

namespace devloop_layer {

namespace fs = std::filesystem;

using devloop_core::Err;
using devloop_core::Error;
using devloop_core::LayerError;
using devloop_core::Ok;
using devloop_core::Result;

namespace {

std::optional<Bytes> read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary | std::ios::ate);
    if (!file) {
        return std::nullopt;
    }
    auto size = file.tellg();
    if (size < 0) {
        return std::nullopt;
    }
    Bytes data(static_cast<std::size_t>(size));
    file.seekg(0);
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), size)) {
        return std::nullopt;
    }
    return data;
}

/// Reject names that would escape the element root
bool is_safe_name(const std::string& name) {
    if (name.empty() || name.front() == '/') {
        return false;
    }
    fs::path p(name);
    for (const auto& part : p) {
        if (part.string() == "..") {
            return false;
        }
    }
    return true;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // anonymous namespace

// =============================================================================
// Element
// =============================================================================

std::optional<Manifest> Element::manifest() const {
    auto res = resource(k_manifest_name);
    if (!res) {
        return std::nullopt;
    }

    try {
        auto json = nlohmann::json::parse(res->data.begin(), res->data.end());
        if (!json.is_object()) {
            devloop_core::layer_logger()->warn("Manifest in {} is not an object", root().string());
            return std::nullopt;
        }
        Manifest manifest;
        for (auto it = json.begin(); it != json.end(); ++it) {
            if (it.value().is_string()) {
                manifest.attributes[it.key()] = it.value().get<std::string>();
            } else {
                manifest.attributes[it.key()] = it.value().dump();
            }
        }
        return manifest;
    } catch (const nlohmann::json::parse_error& e) {
        devloop_core::layer_logger()->warn("Malformed manifest in {}: {}", root().string(), e.what());
        return std::nullopt;
    }
}

Result<std::shared_ptr<Element>> Element::from_path(const fs::path& path) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        auto archive = ArchiveElement::open(path);
        if (!archive) {
            return Err<std::shared_ptr<Element>>(archive.error());
        }
        return Ok<std::shared_ptr<Element>>(std::move(archive).value());
    }
    return Ok<std::shared_ptr<Element>>(std::make_shared<DirectoryElement>(path));
}

// =============================================================================
// DirectoryElement
// =============================================================================

DirectoryElement::DirectoryElement(fs::path root)
    : m_root(std::move(root)) {}

std::optional<Resource> DirectoryElement::resource(const std::string& name) const {
    if (m_closed.load() || !is_safe_name(name)) {
        return std::nullopt;
    }
    fs::path file = m_root / fs::path(name);
    std::error_code ec;
    if (!fs::is_regular_file(file, ec)) {
        return std::nullopt;
    }
    auto data = read_file(file);
    if (!data) {
        devloop_core::layer_logger()->warn("Failed to read {}", file.string());
        return std::nullopt;
    }
    return Resource{name, std::move(*data), m_root, {}};
}

std::set<std::string> DirectoryElement::provided_resources() const {
    std::set<std::string> names;
    if (m_closed.load()) {
        return names;
    }
    std::error_code ec;
    if (!fs::is_directory(m_root, ec)) {
        return names;
    }
    std::error_code entry_ec;
    for (fs::recursive_directory_iterator it(m_root, ec), end; !ec && it != end; it.increment(ec)) {
        // Names stay lexical so that symlinked files keep their name inside the root
        if (it->is_regular_file(entry_ec)) {
            names.insert(it->path().lexically_relative(m_root).generic_string());
        }
    }
    if (ec) {
        devloop_core::layer_logger()->warn("Error walking {}: {}", m_root.string(), ec.message());
    }
    return names;
}

bool DirectoryElement::contains(const std::string& name) const {
    if (m_closed.load() || !is_safe_name(name)) {
        return false;
    }
    std::error_code ec;
    return fs::is_regular_file(m_root / fs::path(name), ec);
}

void DirectoryElement::close() {
    m_closed.store(true);
}

// =============================================================================
// ArchiveElement
// =============================================================================

namespace {

constexpr std::size_t k_block = 512;

std::uint64_t parse_octal(const char* field, std::size_t len) {
    std::uint64_t value = 0;
    std::size_t i = 0;
    while (i < len && (field[i] == ' ' || field[i] == '\0')) ++i;
    for (; i < len && field[i] >= '0' && field[i] <= '7'; ++i) {
        value = (value << 3) + static_cast<std::uint64_t>(field[i] - '0');
    }
    return value;
}

std::string field_string(const char* field, std::size_t len) {
    return std::string(field, strnlen(field, len));
}

bool is_zero_block(const std::array<char, k_block>& block) {
    return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

bool checksum_matches(const std::array<char, k_block>& block) {
    std::uint64_t sum = 0;
    for (std::size_t i = 0; i < k_block; ++i) {
        bool in_field = i >= 148 && i < 156;
        sum += in_field ? static_cast<std::uint64_t>(' ') : static_cast<unsigned char>(block[i]);
    }
    return sum == parse_octal(block.data() + 148, 8);
}

std::uint64_t round_up(std::uint64_t n) {
    return (n + k_block - 1) / k_block * k_block;
}

/// Extract "path" from a pax extended header body ("<len> key=value\n" records)
std::optional<std::string> pax_path(const std::string& body) {
    std::size_t pos = 0;
    while (pos < body.size()) {
        auto space = body.find(' ', pos);
        if (space == std::string::npos) break;
        std::size_t len = 0;
        try {
            len = std::stoul(body.substr(pos, space - pos));
        } catch (const std::exception&) {
            break;
        }
        if (len == 0 || pos + len > body.size()) break;
        std::string record = body.substr(space + 1, pos + len - space - 2);
        if (record.rfind("path=", 0) == 0) {
            return record.substr(5);
        }
        pos += len;
    }
    return std::nullopt;
}

} // anonymous namespace

ArchiveElement::ArchiveElement(fs::path path)
    : m_path(std::move(path)) {}

ArchiveElement::~ArchiveElement() {
    close();
}

Result<std::shared_ptr<ArchiveElement>> ArchiveElement::open(const fs::path& path) {
    std::shared_ptr<ArchiveElement> element(new ArchiveElement(path));
    element->m_stream.open(path, std::ios::binary);
    if (!element->m_stream) {
        return Err<std::shared_ptr<ArchiveElement>>(
            Error(LayerError::open_failed(path.string(), "cannot open file")));
    }

    std::error_code ec;
    const std::uint64_t file_size = fs::file_size(path, ec);
    if (ec) {
        return Err<std::shared_ptr<ArchiveElement>>(
            Error(LayerError::open_failed(path.string(), ec.message())));
    }

    auto& in = element->m_stream;
    std::uint64_t offset = 0;
    std::optional<std::string> pending_name;
    std::array<char, k_block> header{};

    while (offset + k_block <= file_size) {
        in.seekg(static_cast<std::streamoff>(offset));
        if (!in.read(header.data(), k_block)) {
            return Err<std::shared_ptr<ArchiveElement>>(
                Error(LayerError::malformed_archive(path.string(), "truncated header")));
        }
        if (is_zero_block(header)) {
            break;
        }
        if (!checksum_matches(header)) {
            return Err<std::shared_ptr<ArchiveElement>>(
                Error(LayerError::malformed_archive(path.string(), "bad header checksum at offset " + std::to_string(offset))));
        }

        const std::uint64_t size = parse_octal(header.data() + 124, 12);
        const char type = header[156];
        const std::uint64_t data_offset = offset + k_block;
        if (data_offset + size > file_size) {
            return Err<std::shared_ptr<ArchiveElement>>(
                Error(LayerError::malformed_archive(path.string(), "entry exceeds archive size")));
        }

        if (type == 'L' || type == 'x') {
            std::string body(static_cast<std::size_t>(size), '\0');
            in.seekg(static_cast<std::streamoff>(data_offset));
            in.read(body.data(), static_cast<std::streamsize>(size));
            if (type == 'L') {
                pending_name = std::string(body.c_str());
            } else if (auto p = pax_path(body)) {
                pending_name = *p;
            }
        } else {
            std::string name;
            if (pending_name) {
                name = *pending_name;
                pending_name.reset();
            } else {
                std::string prefix = field_string(header.data() + 345, 155);
                name = field_string(header.data(), 100);
                if (!prefix.empty()) {
                    name = prefix + "/" + name;
                }
            }
            while (name.rfind("./", 0) == 0) {
                name.erase(0, 2);
            }
            if ((type == '0' || type == '\0') && !name.empty()) {
                element->m_entries[name] = Entry{data_offset, size};
            }
        }

        offset = data_offset + round_up(size);
    }

    devloop_core::layer_logger()->debug("Opened archive {} ({} entries)", path.string(), element->m_entries.size());
    return Ok(std::move(element));
}

std::optional<Resource> ArchiveElement::resource(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return std::nullopt;
    }
    auto it = m_entries.find(name);
    if (it == m_entries.end()) {
        return std::nullopt;
    }

    Bytes data(static_cast<std::size_t>(it->second.size));
    m_stream.clear();
    m_stream.seekg(static_cast<std::streamoff>(it->second.offset));
    if (!data.empty() && !m_stream.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
        devloop_core::layer_logger()->warn("Failed to read {} from {}", name, m_path.string());
        return std::nullopt;
    }
    return Resource{name, std::move(data), m_path, {}};
}

std::set<std::string> ArchiveElement::provided_resources() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::set<std::string> names;
    if (m_closed) {
        return names;
    }
    for (const auto& [name, entry] : m_entries) {
        names.insert(name);
    }
    return names;
}

bool ArchiveElement::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return !m_closed && m_entries.count(name) > 0;
}

void ArchiveElement::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_closed) {
        return;
    }
    m_closed = true;
    m_stream.close();
}

bool ArchiveElement::is_closed() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_closed;
}

// =============================================================================
// MemoryElement
// =============================================================================

MemoryElement::MemoryElement(std::map<std::string, Bytes> resources)
    : m_resources(std::move(resources)) {}

std::optional<Resource> MemoryElement::resource(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_resources.find(name);
    if (it == m_resources.end()) {
        return std::nullopt;
    }
    return Resource{name, it->second, m_root, {}};
}

std::set<std::string> MemoryElement::provided_resources() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::set<std::string> names;
    for (const auto& [name, data] : m_resources) {
        names.insert(name);
    }
    return names;
}

bool MemoryElement::contains(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_resources.count(name) > 0;
}

void MemoryElement::reset(std::map<std::string, Bytes> resources) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_resources = std::move(resources);
}

std::size_t MemoryElement::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_resources.size();
}

// =============================================================================
// EmptyElement
// =============================================================================

ElementPtr EmptyElement::instance() {
    static ElementPtr empty = std::make_shared<EmptyElement>();
    return empty;
}

// =============================================================================
// FilteredElement
// =============================================================================

FilteredElement::FilteredElement(ElementPtr delegate, std::set<std::string> hidden)
    : m_delegate(std::move(delegate))
    , m_hidden(std::move(hidden)) {}

std::optional<Resource> FilteredElement::resource(const std::string& name) const {
    if (m_hidden.count(name)) {
        return std::nullopt;
    }
    return m_delegate->resource(name);
}

std::set<std::string> FilteredElement::provided_resources() const {
    auto names = m_delegate->provided_resources();
    for (const auto& hidden : m_hidden) {
        names.erase(hidden);
    }
    return names;
}

bool FilteredElement::contains(const std::string& name) const {
    return !m_hidden.count(name) && m_delegate->contains(name);
}

// =============================================================================
// UnitFilteredElement
// =============================================================================

UnitFilteredElement::UnitFilteredElement(ElementPtr delegate, std::string unit_extension)
    : m_delegate(std::move(delegate))
    , m_extension(std::move(unit_extension)) {}

bool UnitFilteredElement::is_unit(const std::string& name) const {
    return ends_with(name, m_extension);
}

std::optional<Resource> UnitFilteredElement::resource(const std::string& name) const {
    if (!is_unit(name)) {
        return std::nullopt;
    }
    return m_delegate->resource(name);
}

std::set<std::string> UnitFilteredElement::provided_resources() const {
    std::set<std::string> names;
    for (const auto& name : m_delegate->provided_resources()) {
        if (is_unit(name)) {
            names.insert(name);
        }
    }
    return names;
}

bool UnitFilteredElement::contains(const std::string& name) const {
    return is_unit(name) && m_delegate->contains(name);
}

} // namespace devloop_layer

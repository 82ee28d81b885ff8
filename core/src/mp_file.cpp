#include "mpkit/io/mp_file.hpp"
#include "mpkit/logging.hpp"
#include "detail/file_state.hpp"

#include <array>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <optional>
#include <thread>

namespace mpkit {
namespace io {

namespace {

// HDF5 format signature
constexpr std::array<unsigned char, 8> HDF5_SIGNATURE = {
    0x89, 'H', 'D', 'F', '\r', '\n', 0x1a, '\n'};

// Highest superblock version defined by the HDF5 file format
constexpr std::uint8_t MAX_SUPERBLOCK_VERSION = 3;

// Guard against hard-link cycles
constexpr int MAX_GROUP_DEPTH = 64;

using detail::Handle;

std::optional<FormatSignature> locateSignature(std::ifstream& in, std::uint64_t file_size) {
    // The superblock may follow a user block of 512 * 2^n bytes
    for (std::uint64_t offset = 0; offset + HDF5_SIGNATURE.size() < file_size;
         offset = offset == 0 ? 512 : offset * 2) {
        std::array<unsigned char, 9> buffer{};
        in.clear();
        in.seekg(static_cast<std::streamoff>(offset));
        in.read(reinterpret_cast<char*>(buffer.data()), buffer.size());
        if (in.gcount() != static_cast<std::streamsize>(buffer.size())) {
            break;
        }
        if (std::memcmp(buffer.data(), HDF5_SIGNATURE.data(), HDF5_SIGNATURE.size()) == 0) {
            FormatSignature sig;
            sig.offset = offset;
            sig.superblock_version = buffer[8];
            return sig;
        }
    }
    return std::nullopt;
}

std::string joinPath(const std::string& parent, const std::string& name) {
    return parent.empty() ? name : parent + "/" + name;
}

std::string normalizePath(const std::string& path) {
    std::string result;
    for (const auto& part : detail::splitPath(path)) {
        result = joinPath(result, part);
    }
    return result;
}

std::string escapeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        if (c == '@' || c == '\\') result += '\\';
        result += c;
    }
    return result;
}

// An attribute key split into the object path and, for HDF5 attributes,
// the attribute name; both unescaped
struct ParsedKey {
    std::string object_path;
    std::optional<std::string> attribute;
};

ParsedKey parseKey(const std::string& key) {
    ParsedKey parsed;
    std::string part;
    std::string* target = &part;
    std::string name;
    for (std::size_t i = 0; i < key.size(); ++i) {
        char c = key[i];
        if (c == '\\' && i + 1 < key.size()) {
            *target += key[++i];
        } else if (c == '@' && !parsed.attribute) {
            if (!part.empty()) parsed.object_path = joinPath(parsed.object_path, part);
            part.clear();
            parsed.attribute.emplace();
            target = &name;
        } else if (c == '/' && !parsed.attribute) {
            if (!part.empty()) parsed.object_path = joinPath(parsed.object_path, part);
            part.clear();
        } else {
            *target += c;
        }
    }
    if (parsed.attribute) {
        parsed.attribute = std::move(name);
    } else if (!part.empty()) {
        parsed.object_path = joinPath(parsed.object_path, part);
    }
    return parsed;
}

ValueClass classify(hid_t type) {
    switch (H5Tget_class(type)) {
        case H5T_INTEGER:
            return H5Tget_sign(type) == H5T_SGN_NONE ? ValueClass::UNSIGNED
                                                     : ValueClass::SIGNED;
        case H5T_ENUM: {
            Handle super = detail::typeHandle(H5Tget_super(type));
            return H5Tget_sign(super.get()) == H5T_SGN_NONE ? ValueClass::UNSIGNED
                                                            : ValueClass::SIGNED;
        }
        case H5T_FLOAT:
            return ValueClass::FLOAT;
        case H5T_STRING:
            return ValueClass::STRING;
        case H5T_OPAQUE:
            return ValueClass::BYTES;
        case H5T_COMPOUND:
        case H5T_BITFIELD:
        case H5T_ARRAY:
            return ValueClass::STRUCTURED;
        default:
            // Variable-length sequences, references and time types
            return ValueClass::UNKNOWN;
    }
}

Shape shapeOf(hid_t space) {
    switch (H5Sget_simple_extent_type(space)) {
        case H5S_SCALAR:
            return {};
        case H5S_NULL:
            return {0};
        default:
            break;
    }
    int rank = H5Sget_simple_extent_ndims(space);
    if (rank <= 0) return {};
    std::vector<hsize_t> dims(static_cast<std::size_t>(rank));
    H5Sget_simple_extent_dims(space, dims.data(), nullptr);
    return Shape(dims.begin(), dims.end());
}

// Widen stored integers of any size to 64 bits
template<typename Target>
std::vector<Target> widenIntegers(const std::vector<std::uint8_t>& buffer,
                                  std::size_t size, bool is_signed) {
    std::size_t count = size == 0 ? 0 : buffer.size() / size;
    std::vector<Target> result(count);
    for (std::size_t i = 0; i < count; ++i) {
        const std::uint8_t* p = buffer.data() + i * size;
        if (is_signed) {
            switch (size) {
                case 1: { std::int8_t v; std::memcpy(&v, p, 1); result[i] = static_cast<Target>(v); break; }
                case 2: { std::int16_t v; std::memcpy(&v, p, 2); result[i] = static_cast<Target>(v); break; }
                case 4: { std::int32_t v; std::memcpy(&v, p, 4); result[i] = static_cast<Target>(v); break; }
                default: { std::int64_t v; std::memcpy(&v, p, 8); result[i] = static_cast<Target>(v); break; }
            }
        } else {
            switch (size) {
                case 1: { std::uint8_t v; std::memcpy(&v, p, 1); result[i] = static_cast<Target>(v); break; }
                case 2: { std::uint16_t v; std::memcpy(&v, p, 2); result[i] = static_cast<Target>(v); break; }
                case 4: { std::uint32_t v; std::memcpy(&v, p, 4); result[i] = static_cast<Target>(v); break; }
                default: { std::uint64_t v; std::memcpy(&v, p, 8); result[i] = static_cast<Target>(v); break; }
            }
        }
    }
    return result;
}

// Releases memory HDF5 allocated for variable-length strings
class VlenBuffer {
public:
    VlenBuffer(hid_t type, hid_t space, std::size_t count)
        : type_(type), space_(space), pointers_(count, nullptr) {}
    ~VlenBuffer() {
        if (read_) H5Dvlen_reclaim(type_, space_, H5P_DEFAULT, pointers_.data());
    }
    VlenBuffer(const VlenBuffer&) = delete;
    VlenBuffer& operator=(const VlenBuffer&) = delete;

    char** data() { return pointers_.data(); }
    void markRead() { read_ = true; }
    const std::vector<char*>& pointers() const { return pointers_; }

private:
    hid_t type_;
    hid_t space_;
    std::vector<char*> pointers_;
    bool read_ = false;
};

template<typename ReadFn>
RawAttribute decodeValue(const std::string& path, RawAttribute::Source source,
                         hid_t type, hid_t space, ReadFn&& read) {
    RawAttribute attr;
    attr.path = path;
    attr.source = source;
    attr.value_class = classify(type);
    attr.element_size = H5Tget_size(type);
    attr.shape = shapeOf(space);

    const std::size_t n = attr.size();
    auto fail = [&path]() {
        throw CorruptDataError(detail::describeFailure("failed to read " + path));
    };

    switch (attr.value_class) {
        case ValueClass::SIGNED:
        case ValueClass::UNSIGNED: {
            const bool is_signed = attr.value_class == ValueClass::SIGNED;
            if (H5Tget_class(type) == H5T_ENUM) {
                // Enums cannot be converted by HDF5; read native and widen
                Handle native = detail::typeHandle(H5Tget_native_type(type, H5T_DIR_ASCEND));
                std::size_t size = H5Tget_size(native.get());
                std::vector<std::uint8_t> buffer(n * size);
                if (n > 0 && read(native.get(), buffer.data()) < 0) fail();
                if (is_signed) {
                    attr.value = widenIntegers<std::int64_t>(buffer, size, true);
                } else {
                    attr.value = widenIntegers<std::uint64_t>(buffer, size, false);
                }
            } else if (is_signed) {
                std::vector<std::int64_t> values(n);
                if (n > 0 && read(H5T_NATIVE_INT64, values.data()) < 0) fail();
                attr.value = std::move(values);
            } else {
                std::vector<std::uint64_t> values(n);
                if (n > 0 && read(H5T_NATIVE_UINT64, values.data()) < 0) fail();
                attr.value = std::move(values);
            }
            break;
        }
        case ValueClass::FLOAT: {
            std::vector<double> values(n);
            if (n > 0 && read(H5T_NATIVE_DOUBLE, values.data()) < 0) fail();
            attr.value = std::move(values);
            break;
        }
        case ValueClass::STRING: {
            std::vector<std::string> values;
            values.reserve(n);
            if (H5Tis_variable_str(type) > 0) {
                Handle mem = detail::typeHandle(H5Tcopy(H5T_C_S1));
                H5Tset_size(mem.get(), H5T_VARIABLE);
                H5Tset_cset(mem.get(), H5Tget_cset(type));
                VlenBuffer buffer(mem.get(), space, n);
                if (n > 0) {
                    if (read(mem.get(), buffer.data()) < 0) fail();
                    buffer.markRead();
                }
                for (const char* s : buffer.pointers()) {
                    values.emplace_back(s ? s : "");
                }
            } else {
                const std::size_t size = attr.element_size;
                const bool space_padded = H5Tget_strpad(type) == H5T_STR_SPACEPAD;
                Handle mem = detail::typeHandle(H5Tcopy(type));
                std::vector<char> buffer(n * size);
                if (n > 0 && read(mem.get(), buffer.data()) < 0) fail();
                for (std::size_t i = 0; i < n; ++i) {
                    std::string s(buffer.data() + i * size, size);
                    auto nul = s.find('\0');
                    if (nul != std::string::npos) s.resize(nul);
                    if (space_padded) {
                        auto last = s.find_last_not_of(' ');
                        s.resize(last == std::string::npos ? 0 : last + 1);
                    }
                    values.push_back(std::move(s));
                }
            }
            attr.value = std::move(values);
            break;
        }
        case ValueClass::BYTES:
        case ValueClass::STRUCTURED: {
            hid_t native = H5Tget_native_type(type, H5T_DIR_ASCEND);
            Handle mem = detail::typeHandle(native >= 0 ? native : H5Tcopy(type));
            attr.element_size = H5Tget_size(mem.get());
            std::vector<std::uint8_t> buffer(n * attr.element_size);
            if (n > 0 && read(mem.get(), buffer.data()) < 0) fail();
            attr.value = std::move(buffer);
            break;
        }
        default:
            // Kept with its shape but without a value
            attr.value = std::vector<std::uint8_t>{};
            MPKIT_LOG_DEBUG("unsupported value type, value not read",
                            {stringField("path", path)});
            break;
    }
    return attr;
}

RawAttribute readDatasetValue(hid_t dataset, const std::string& key) {
    Handle type = detail::typeHandle(H5Dget_type(dataset));
    Handle space = detail::spaceHandle(H5Dget_space(dataset));
    if (!type || !space) {
        throw CorruptDataError(detail::describeFailure("cannot inspect dataset " + key));
    }
    return decodeValue(key, RawAttribute::Source::DATASET, type.get(), space.get(),
                       [dataset](hid_t mem, void* buffer) {
                           return H5Dread(dataset, mem, H5S_ALL, H5S_ALL, H5P_DEFAULT, buffer);
                       });
}

RawAttribute readAttributeValue(hid_t object, const std::string& name,
                                const std::string& key) {
    Handle attr = detail::attributeHandle(H5Aopen(object, name.c_str(), H5P_DEFAULT));
    if (!attr) {
        throw CorruptDataError(detail::describeFailure("cannot open attribute " + key));
    }
    Handle type = detail::typeHandle(H5Aget_type(attr.get()));
    Handle space = detail::spaceHandle(H5Aget_space(attr.get()));
    if (!type || !space) {
        throw CorruptDataError(detail::describeFailure("cannot inspect attribute " + key));
    }
    hid_t attr_id = attr.get();
    return decodeValue(key, RawAttribute::Source::ATTRIBUTE, type.get(), space.get(),
                       [attr_id](hid_t mem, void* buffer) {
                           return H5Aread(attr_id, mem, buffer);
                       });
}

herr_t collectAttributeName(hid_t, const char* name, const H5A_info_t*, void* data) {
    try {
        static_cast<std::vector<std::string>*>(data)->emplace_back(name);
    } catch (const std::exception&) {
        return -1;
    }
    return 0;
}

herr_t collectLinkName(hid_t, const char* name, const H5L_info_t*, void* data) {
    try {
        static_cast<std::vector<std::string>*>(data)->emplace_back(name);
    } catch (const std::exception&) {
        return -1;
    }
    return 0;
}

std::vector<std::string> attributeNames(hid_t object, const std::string& path) {
    std::vector<std::string> names;
    hsize_t idx = 0;
    if (H5Aiterate2(object, H5_INDEX_CRT_ORDER, H5_ITER_INC, &idx,
                    collectAttributeName, &names) >= 0) {
        return names;
    }
    // Creation order not tracked: storage order
    H5Eclear2(H5E_DEFAULT);
    names.clear();
    idx = 0;
    if (H5Aiterate2(object, H5_INDEX_NAME, H5_ITER_NATIVE, &idx,
                    collectAttributeName, &names) < 0) {
        throw CorruptDataError(detail::describeFailure("cannot list attributes of /" + path));
    }
    return names;
}

std::vector<std::string> linkNames(hid_t group, const std::string& path) {
    std::vector<std::string> names;
    hsize_t idx = 0;
    if (H5Literate(group, H5_INDEX_CRT_ORDER, H5_ITER_INC, &idx,
                   collectLinkName, &names) >= 0) {
        return names;
    }
    H5Eclear2(H5E_DEFAULT);
    names.clear();
    idx = 0;
    if (H5Literate(group, H5_INDEX_NAME, H5_ITER_NATIVE, &idx,
                   collectLinkName, &names) < 0) {
        throw CorruptDataError(detail::describeFailure("cannot list group /" + path));
    }
    return names;
}

void readObjectAttributes(hid_t object, const std::string& path, ContainerWalk& out) {
    for (const auto& name : attributeNames(object, path)) {
        out.attributes.push_back(readAttributeValue(object, name, attributeKey(path, name)));
    }
}

void walkGroup(hid_t file, hid_t group, const std::string& path, int depth,
               const ReaderOptions& options, ContainerWalk& out) {
    if (depth > MAX_GROUP_DEPTH) {
        throw FormatError("group nesting deeper than " + std::to_string(MAX_GROUP_DEPTH) +
                          " levels at /" + path);
    }

    for (const auto& name : linkNames(group, path)) {
        const std::string child = joinPath(path, name);
        Handle object = detail::openObject(file, child);
        if (!object) {
            MPKIT_LOG_DEBUG("skipping unresolvable link", {stringField("path", child)});
            continue;
        }

        switch (H5Iget_type(object.get())) {
            case H5I_GROUP:
                readObjectAttributes(object.get(), child, out);
                walkGroup(file, object.get(), child, depth + 1, options, out);
                break;
            case H5I_DATASET: {
                DatasetInfo info = detail::describeDataset(object.get(), child);
                if (info.elementCount() <= options.max_attribute_elements) {
                    out.attributes.push_back(readDatasetValue(object.get(), datasetKey(child)));
                } else {
                    out.datasets.push_back(std::move(info));
                }
                readObjectAttributes(object.get(), child, out);
                break;
            }
            default:
                readObjectAttributes(object.get(), child, out);
                break;
        }
    }
}

} // namespace

namespace detail {

namespace {

herr_t innermostError(unsigned n, const H5E_error2_t* err, void* data) {
    if (n == 0 && err && err->desc) {
        *static_cast<std::string*>(data) = err->desc;
    }
    return 0;
}

} // namespace

std::string lastHdf5Error() {
    std::string message;
    H5Ewalk2(H5E_DEFAULT, H5E_WALK_UPWARD, innermostError, &message);
    H5Eclear2(H5E_DEFAULT);
    return message;
}

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : path) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(std::move(current));
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(std::move(current));
    return parts;
}

Handle openObject(hid_t file, const std::string& path) {
    std::string current;
    for (const auto& part : splitPath(path)) {
        current += "/" + part;
        // Fails as well when an intermediate component is not a group
        if (H5Lexists(file, current.c_str(), H5P_DEFAULT) <= 0) {
            H5Eclear2(H5E_DEFAULT);
            return Handle();
        }
    }
    if (current.empty()) current = "/";

    hid_t id = H5Oopen(file, current.c_str(), H5P_DEFAULT);
    if (id < 0) {
        H5Eclear2(H5E_DEFAULT);
        return Handle();
    }
    return objectHandle(id);
}

Handle openDataset(hid_t file, const std::string& path) {
    Handle object = openObject(file, path);
    if (!object || H5Iget_type(object.get()) != H5I_DATASET) {
        return Handle();
    }
    return object;
}

DatasetInfo describeDataset(hid_t dataset, const std::string& path) {
    DatasetInfo info;
    info.path = path;

    Handle type = typeHandle(H5Dget_type(dataset));
    Handle space = spaceHandle(H5Dget_space(dataset));
    Handle dcpl = plistHandle(H5Dget_create_plist(dataset));
    if (!type || !space || !dcpl) {
        throw CorruptDataError(describeFailure("cannot describe dataset " + path));
    }

    info.value_class = classify(type.get());
    info.element_size = H5Tget_size(type.get());
    info.shape = shapeOf(space.get());

    switch (H5Pget_layout(dcpl.get())) {
        case H5D_COMPACT: info.layout = DatasetLayout::COMPACT; break;
        case H5D_CONTIGUOUS: info.layout = DatasetLayout::CONTIGUOUS; break;
        case H5D_CHUNKED: info.layout = DatasetLayout::CHUNKED; break;
        default: info.layout = DatasetLayout::OTHER; break;
    }

    if (info.layout == DatasetLayout::CHUNKED) {
        std::array<hsize_t, H5S_MAX_RANK> dims{};
        int rank = H5Pget_chunk(dcpl.get(), H5S_MAX_RANK, dims.data());
        if (rank < 0) {
            throw CorruptDataError(describeFailure("cannot read chunk layout of " + path));
        }
        info.chunk_shape.assign(dims.begin(), dims.begin() + rank);
    }

    int nfilters = H5Pget_nfilters(dcpl.get());
    for (int i = 0; i < nfilters; ++i) {
        unsigned flags = 0;
        std::size_t cd_nelmts = 0;
        unsigned filter_config = 0;
        std::array<char, 256> name{};
        H5Z_filter_t id = H5Pget_filter2(dcpl.get(), static_cast<unsigned>(i), &flags,
                                         &cd_nelmts, nullptr, name.size(), name.data(),
                                         &filter_config);
        if (id < 0) {
            throw CorruptDataError(describeFailure("cannot read filter pipeline of " + path));
        }
        info.filters.push_back({static_cast<int>(id), std::string(name.data())});
    }

    return info;
}

} // namespace detail

MPFile::MPFile(std::shared_ptr<detail::FileState> state) : state_(std::move(state)) {}

MPFile::~MPFile() {
    close();
}

MPFile::MPFile(MPFile&&) noexcept = default;

MPFile& MPFile::operator=(MPFile&& other) noexcept {
    if (this != &other) {
        close();
        state_ = std::move(other.state_);
    }
    return *this;
}

MPFile MPFile::open(const std::string& path, const ReaderOptions& options) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (ec || !std::filesystem::exists(status)) {
        throw NotFoundError(path, "no such file");
    }
    if (!std::filesystem::is_regular_file(status)) {
        throw NotFoundError(path, "not a regular file");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw NotFoundError(path, "cannot read file");
    }
    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw NotFoundError(path, "cannot determine size of file");
    }

    auto signature = locateSignature(in, file_size);
    if (!signature) {
        throw FormatError("no HDF5 signature found in " + path);
    }
    if (signature->superblock_version > MAX_SUPERBLOCK_VERSION) {
        throw FormatError("unsupported superblock version " +
                          std::to_string(signature->superblock_version) + " in " + path);
    }
    in.close();

    auto state = std::make_shared<detail::FileState>();
    state->path = path;
    state->signature = *signature;
    state->options = options;

    detail::ErrorStackGuard guard;
    Handle fapl = detail::plistHandle(H5Pcreate(H5P_FILE_ACCESS));
    if (!fapl) {
        throw CorruptDataError(detail::describeFailure("cannot create file access list"));
    }
    // Closing the file closes every object opened through it
    H5Pset_fclose_degree(fapl.get(), H5F_CLOSE_STRONG);

    std::string last_error;
    for (unsigned attempt = 0; attempt <= options.open_retries; ++attempt) {
        hid_t id = H5Fopen(path.c_str(), H5F_ACC_RDONLY, fapl.get());
        if (id >= 0) {
            state->file = detail::fileHandle(id);
            break;
        }
        last_error = detail::lastHdf5Error();
        if (attempt < options.open_retries) {
            MPKIT_LOG_WARN("HDF5 refused file, retrying",
                           {stringField("path", path), intField("attempt", attempt + 1),
                            stringField("error", last_error)});
            std::this_thread::sleep_for(options.retry_delay);
        }
    }

    if (!state->file) {
        MPKIT_LOG_ERROR("cannot open container", {stringField("path", path),
                                                  stringField("error", last_error)});
        throw CorruptDataError("cannot open container " + path +
                               (last_error.empty() ? "" : ": " + last_error));
    }

    MPKIT_LOG_DEBUG("opened mp file",
                    {stringField("path", path),
                     intField("superblock_version", signature->superblock_version),
                     intField("user_block", static_cast<std::int64_t>(signature->offset))});
    return MPFile(std::move(state));
}

bool MPFile::isValidMP(const std::string& path) {
    std::error_code ec;
    auto file_size = std::filesystem::file_size(path, ec);
    if (ec) return false;

    std::ifstream in(path, std::ios::binary);
    if (!in) return false;

    auto signature = locateSignature(in, file_size);
    return signature && signature->superblock_version <= MAX_SUPERBLOCK_VERSION;
}

void MPFile::close() noexcept {
    if (state_ && state_->file) {
        detail::ErrorStackGuard guard;
        state_->file.reset();
        MPKIT_LOG_DEBUG("closed mp file", {stringField("path", state_->path)});
    }
}

bool MPFile::isOpen() const noexcept {
    return state_ && state_->isOpen();
}

const std::string& MPFile::path() const noexcept {
    static const std::string empty;
    return state_ ? state_->path : empty;
}

const FormatSignature& MPFile::signature() const noexcept {
    static const FormatSignature none;
    return state_ ? state_->signature : none;
}

const ReaderOptions& MPFile::options() const noexcept {
    static const ReaderOptions defaults;
    return state_ ? state_->options : defaults;
}

std::vector<std::string> MPFile::listGroups() const {
    std::vector<std::string> names;
    for (auto& entry : listEntries("/")) {
        names.push_back(std::move(entry.name));
    }
    return names;
}

std::vector<EntryInfo> MPFile::listEntries(const std::string& group) const {
    if (!state_) throw std::logic_error("mp file was moved from");
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;

    const std::string group_path = normalizePath(group);
    Handle handle = detail::openObject(file, group_path);
    if (!handle || H5Iget_type(handle.get()) != H5I_GROUP) {
        throw MissingKeyError(group.empty() ? "/" : group, "no such group");
    }

    std::vector<EntryInfo> entries;
    for (auto& name : linkNames(handle.get(), group_path)) {
        EntryInfo entry;
        entry.path = joinPath(group_path, name);
        entry.name = std::move(name);
        Handle object = detail::openObject(file, entry.path);
        if (object) {
            switch (H5Iget_type(object.get())) {
                case H5I_GROUP: entry.kind = EntryKind::GROUP; break;
                case H5I_DATASET: entry.kind = EntryKind::DATASET; break;
                default: entry.kind = EntryKind::OTHER; break;
            }
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}

bool MPFile::hasAttribute(const std::string& path) const {
    if (!state_) return false;
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;

    const ParsedKey key = parseKey(path);
    if (key.attribute) {
        const std::string& name = *key.attribute;
        Handle object = detail::openObject(file, key.object_path);
        if (!object || name.empty()) return false;
        htri_t exists = H5Aexists(object.get(), name.c_str());
        H5Eclear2(H5E_DEFAULT);
        return exists > 0;
    }

    Handle dataset = detail::openDataset(file, key.object_path);
    if (!dataset) return false;
    Handle space = detail::spaceHandle(H5Dget_space(dataset.get()));
    hssize_t npoints = space ? H5Sget_simple_extent_npoints(space.get()) : -1;
    return npoints >= 0 &&
           static_cast<std::uint64_t>(npoints) <= state_->options.max_attribute_elements;
}

bool MPFile::hasDataset(const std::string& path) const {
    if (!state_) return false;
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;
    return static_cast<bool>(detail::openDataset(file, path));
}

RawAttribute MPFile::readAttribute(const std::string& path) const {
    if (!state_) throw std::logic_error("mp file was moved from");
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;

    const ParsedKey key = parseKey(path);
    if (key.attribute) {
        const std::string& name = *key.attribute;
        Handle object = detail::openObject(file, key.object_path);
        if (!object || name.empty() || H5Aexists(object.get(), name.c_str()) <= 0) {
            H5Eclear2(H5E_DEFAULT);
            throw MissingKeyError(path);
        }
        return readAttributeValue(object.get(), name, attributeKey(key.object_path, name));
    }

    const std::string& dataset_path = key.object_path;
    Handle dataset = detail::openDataset(file, dataset_path);
    if (!dataset) {
        throw MissingKeyError(path);
    }
    Handle space = detail::spaceHandle(H5Dget_space(dataset.get()));
    hssize_t npoints = space ? H5Sget_simple_extent_npoints(space.get()) : -1;
    if (npoints < 0) {
        throw CorruptDataError(detail::describeFailure("cannot inspect dataset " + path));
    }
    if (static_cast<std::uint64_t>(npoints) > state_->options.max_attribute_elements) {
        throw MissingKeyError(path, "bulk dataset, use readDataset");
    }
    return readDatasetValue(dataset.get(), datasetKey(dataset_path));
}

ContainerWalk MPFile::walk() const {
    if (!state_) throw std::logic_error("mp file was moved from");
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;

    ContainerWalk result;
    Handle root = detail::openObject(file, "/");
    if (!root) {
        throw CorruptDataError(detail::describeFailure("cannot open root group of " + state_->path));
    }
    readObjectAttributes(root.get(), "", result);
    walkGroup(file, root.get(), "", 0, state_->options, result);

    MPKIT_LOG_DEBUG("walked container",
                    {stringField("path", state_->path),
                     intField("attributes", static_cast<std::int64_t>(result.attributes.size())),
                     intField("datasets", static_cast<std::int64_t>(result.datasets.size()))});
    return result;
}

DatasetInfo MPFile::datasetInfo(const std::string& path) const {
    if (!state_) throw std::logic_error("mp file was moved from");
    hid_t file = state_->require();
    detail::ErrorStackGuard guard;

    const std::string dataset_path = normalizePath(path);
    Handle dataset = detail::openDataset(file, dataset_path);
    if (!dataset) {
        throw MissingKeyError(path, "no such dataset");
    }
    return detail::describeDataset(dataset.get(), dataset_path);
}

ChunkSequence MPFile::readDataset(const std::string& path) const {
    return ChunkSequence(state_, datasetInfo(path));
}

std::string datasetKey(const std::string& dataset_path) {
    std::string key;
    for (const auto& part : detail::splitPath(dataset_path)) {
        key = joinPath(key, escapeName(part));
    }
    return key;
}

std::string attributeKey(const std::string& object_path, const std::string& name) {
    return datasetKey(object_path) + "@" + escapeName(name);
}

std::size_t openObjectCount() {
    ssize_t count = H5Fget_obj_count(H5F_OBJ_ALL, H5F_OBJ_ALL);
    return count < 0 ? 0 : static_cast<std::size_t>(count);
}

} // namespace io
} // namespace mpkit

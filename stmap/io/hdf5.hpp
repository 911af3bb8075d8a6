#pragma once

#include "stmap/core/type.hpp"
#include "stmap/core/error.hpp"
#include "stmap/core/macros.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

#ifdef STMAP_HAS_HDF5
#include <hdf5.h>

// =============================================================================
// FILE: stmap/io/hdf5.hpp
// BRIEF: RAII wrapper over the HDF5 C API
// =============================================================================
//
// Every handle closes itself; every failing HDF5 call raises IOError.
// Only what the h5ad-style layout needs is wrapped: files, groups, datasets,
// attributes and string data (fixed and variable length).
// =============================================================================

namespace stmap::io::h5 {

namespace detail {

template <typename T>
inline hid_t native_type() {
    if constexpr (std::is_same_v<T, float>)              return H5T_NATIVE_FLOAT;
    else if constexpr (std::is_same_v<T, double>)        return H5T_NATIVE_DOUBLE;
    else if constexpr (std::is_same_v<T, std::int16_t>)  return H5T_NATIVE_INT16;
    else if constexpr (std::is_same_v<T, std::int32_t>)  return H5T_NATIVE_INT32;
    else if constexpr (std::is_same_v<T, std::int64_t>)  return H5T_NATIVE_INT64;
    else if constexpr (std::is_same_v<T, std::uint64_t>) return H5T_NATIVE_UINT64;
    else {
        static_assert(!std::is_same_v<T, T>, "native_type: unsupported element type");
    }
}

inline void check_h5(herr_t err, const std::string& context) {
    if (err < 0) {
        throw IOError("HDF5: " + context);
    }
}

inline void check_id(hid_t id, const std::string& context) {
    if (id < 0) {
        throw IOError("HDF5 invalid ID: " + context);
    }
}

inline std::string trim_fixed(const char* buf, size_t len) {
    size_t n = 0;
    while (n < len && buf[n] != '\0') ++n;
    return std::string(buf, n);
}

} // namespace detail

enum class ObjectType {
    Unknown,
    Group,
    Dataset
};

// =============================================================================
// Object - owns one hid_t
// =============================================================================

class Object {
protected:
    hid_t _id;
    herr_t (*_closer)(hid_t);

    Object(hid_t id, herr_t (*closer)(hid_t)) noexcept
        : _id(id), _closer(closer) {}

    Object() noexcept : _id(H5I_INVALID_HID), _closer(nullptr) {}

public:
    virtual ~Object() noexcept { close(); }

    void close() noexcept {
        if (is_valid() && _closer) {
            _closer(_id);
        }
        _id = H5I_INVALID_HID;
        _closer = nullptr;
    }

    Object(Object&& other) noexcept
        : _id(other._id), _closer(other._closer)
    {
        other._id = H5I_INVALID_HID;
        other._closer = nullptr;
    }

    Object& operator=(Object&& other) noexcept {
        if (this != &other) {
            close();
            _id = other._id;
            _closer = other._closer;
            other._id = H5I_INVALID_HID;
            other._closer = nullptr;
        }
        return *this;
    }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;

    STMAP_NODISCARD hid_t id() const noexcept { return _id; }
    STMAP_NODISCARD bool is_valid() const noexcept { return _id >= 0; }
};

// =============================================================================
// Dataspace / Datatype
// =============================================================================

class Dataspace : public Object {
public:
    explicit Dataspace(const std::vector<hsize_t>& dims)
        : Object(H5Screate_simple(static_cast<int>(dims.size()), dims.data(), nullptr), H5Sclose)
    {
        detail::check_id(_id, "H5Screate_simple");
    }

    static Dataspace adopt(hid_t id) {
        detail::check_id(id, "dataspace");
        Dataspace s;
        s._id = id;
        s._closer = H5Sclose;
        return s;
    }

    static Dataspace scalar() {
        return adopt(H5Screate(H5S_SCALAR));
    }

    STMAP_NODISCARD std::vector<hsize_t> get_dims() const {
        const int rank = H5Sget_simple_extent_ndims(_id);
        detail::check_h5(rank, "H5Sget_simple_extent_ndims");
        std::vector<hsize_t> dims(static_cast<size_t>(rank));
        if (rank > 0) {
            detail::check_h5(H5Sget_simple_extent_dims(_id, dims.data(), nullptr),
                             "H5Sget_simple_extent_dims");
        }
        return dims;
    }

    STMAP_NODISCARD hsize_t get_num_elements() const {
        const hssize_t n = H5Sget_simple_extent_npoints(_id);
        detail::check_h5(static_cast<herr_t>(n < 0 ? -1 : 0), "H5Sget_simple_extent_npoints");
        return static_cast<hsize_t>(n);
    }

private:
    Dataspace() = default;
};

class Datatype : public Object {
public:
    // Takes ownership of an id returned by H5*get_type / H5Tcopy
    static Datatype adopt(hid_t id) {
        detail::check_id(id, "datatype");
        Datatype t;
        t._id = id;
        t._closer = H5Tclose;
        return t;
    }

    static Datatype string_vlen() {
        Datatype t = adopt(H5Tcopy(H5T_C_S1));
        detail::check_h5(H5Tset_size(t._id, H5T_VARIABLE), "H5Tset_size(VARIABLE)");
        detail::check_h5(H5Tset_cset(t._id, H5T_CSET_UTF8), "H5Tset_cset");
        return t;
    }

    STMAP_NODISCARD size_t get_size() const { return H5Tget_size(_id); }
    STMAP_NODISCARD H5T_class_t get_class() const { return H5Tget_class(_id); }
    STMAP_NODISCARD bool is_variable_string() const { return H5Tis_variable_str(_id) > 0; }

private:
    Datatype() = default;
};

// =============================================================================
// Attribute
// =============================================================================

class Attribute : public Object {
public:
    Attribute(hid_t loc_id, const std::string& name)
        : Object(H5Aopen(loc_id, name.c_str(), H5P_DEFAULT), H5Aclose)
    {
        detail::check_id(_id, "H5Aopen: " + name);
    }

    static Attribute create(hid_t loc_id, const std::string& name,
                            const Datatype& type, const Dataspace& space) {
        hid_t id = H5Acreate2(loc_id, name.c_str(), type.id(), space.id(),
                              H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Acreate: " + name);
        return Attribute(id);
    }

    STMAP_NODISCARD std::string read_string() const {
        Datatype dtype = Datatype::adopt(H5Aget_type(_id));

        if (dtype.is_variable_string()) {
            Datatype mem = Datatype::string_vlen();
            char* str = nullptr;
            detail::check_h5(H5Aread(_id, mem.id(), &str), "H5Aread vlen string");
            std::string out(str != nullptr ? str : "");
            if (str != nullptr) {
                Dataspace space = Dataspace::adopt(H5Aget_space(_id));
                detail::check_h5(H5Dvlen_reclaim(mem.id(), space.id(), H5P_DEFAULT, &str),
                                 "H5Dvlen_reclaim");
            }
            return out;
        }

        std::string buf(dtype.get_size(), '\0');
        detail::check_h5(H5Aread(_id, dtype.id(), buf.data()), "H5Aread string");
        return detail::trim_fixed(buf.data(), buf.size());
    }

    template <typename T>
    STMAP_NODISCARD std::vector<T> read_vector() const {
        Dataspace space = Dataspace::adopt(H5Aget_space(_id));
        std::vector<T> data(static_cast<size_t>(space.get_num_elements()));
        if (!data.empty()) {
            detail::check_h5(H5Aread(_id, detail::native_type<T>(), data.data()), "H5Aread");
        }
        return data;
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(H5Awrite(_id, detail::native_type<T>(), buffer), "H5Awrite");
    }

private:
    explicit Attribute(hid_t id) : Object(id, H5Aclose) {}
};

// =============================================================================
// Dataset
// =============================================================================

class Dataset : public Object {
public:
    Dataset(hid_t loc_id, const std::string& name)
        : Object(H5Dopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Dclose)
    {
        detail::check_id(_id, "H5Dopen: " + name);
    }

    static Dataset create(hid_t loc_id, const std::string& name,
                          const Datatype& type, const Dataspace& space) {
        hid_t id = H5Dcreate2(loc_id, name.c_str(), type.id(), space.id(),
                              H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id);
    }

    template <typename T>
    static Dataset create(hid_t loc_id, const std::string& name,
                          const std::vector<hsize_t>& dims) {
        hid_t id = H5Dcreate2(loc_id, name.c_str(), detail::native_type<T>(),
                              Dataspace(dims).id(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Dcreate: " + name);
        return Dataset(id);
    }

    STMAP_NODISCARD Dataspace get_space() const {
        return Dataspace::adopt(H5Dget_space(_id));
    }

    STMAP_NODISCARD Datatype get_type() const {
        return Datatype::adopt(H5Dget_type(_id));
    }

    STMAP_NODISCARD std::vector<hsize_t> get_dims() const {
        return get_space().get_dims();
    }

    STMAP_NODISCARD hsize_t get_num_elements() const {
        return get_space().get_num_elements();
    }

    // Element conversion (e.g. float64 on disk into float buffers) is done by HDF5
    template <typename T>
    void read(T* buffer) const {
        detail::check_h5(H5Dread(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL,
                                 H5P_DEFAULT, buffer), "H5Dread");
    }

    template <typename T>
    void write(const T* buffer) {
        detail::check_h5(H5Dwrite(_id, detail::native_type<T>(), H5S_ALL, H5S_ALL,
                                  H5P_DEFAULT, buffer), "H5Dwrite");
    }

    template <typename T>
    STMAP_NODISCARD std::vector<T> read_vector() const {
        std::vector<T> data(static_cast<size_t>(get_num_elements()));
        if (!data.empty()) {
            read(data.data());
        }
        return data;
    }

    STMAP_NODISCARD std::vector<std::string> read_strings() const {
        const size_t n = static_cast<size_t>(get_num_elements());
        std::vector<std::string> out;
        out.reserve(n);
        if (n == 0) return out;

        Datatype dtype = get_type();
        STMAP_CHECK_ARG(dtype.get_class() == H5T_STRING, "read_strings: dataset is not a string dataset");

        if (dtype.is_variable_string()) {
            Datatype mem = Datatype::string_vlen();
            std::vector<char*> ptrs(n, nullptr);
            detail::check_h5(H5Dread(_id, mem.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
                             "H5Dread vlen strings");
            for (char* p : ptrs) {
                out.emplace_back(p != nullptr ? p : "");
            }
            Dataspace space = get_space();
            detail::check_h5(H5Dvlen_reclaim(mem.id(), space.id(), H5P_DEFAULT, ptrs.data()),
                             "H5Dvlen_reclaim");
            return out;
        }

        const size_t width = dtype.get_size();
        std::vector<char> buf(width * n, '\0');
        detail::check_h5(H5Dread(_id, dtype.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, buf.data()),
                         "H5Dread fixed strings");
        for (size_t k = 0; k < n; ++k) {
            out.push_back(detail::trim_fixed(buf.data() + k * width, width));
        }
        return out;
    }

private:
    explicit Dataset(hid_t id) : Object(id, H5Dclose) {}
};

// =============================================================================
// Location - File and Group share child access
// =============================================================================

class Location : public Object {
protected:
    using Object::Object;
    Location() = default;

public:
    STMAP_NODISCARD bool exists(const std::string& name) const {
        return H5Lexists(_id, name.c_str(), H5P_DEFAULT) > 0;
    }

    STMAP_NODISCARD bool has_attr(const std::string& name) const {
        return H5Aexists(_id, name.c_str()) > 0;
    }

    STMAP_NODISCARD ObjectType get_object_type(const std::string& name) const {
        if (!exists(name)) return ObjectType::Unknown;
        hid_t obj = H5Oopen(_id, name.c_str(), H5P_DEFAULT);
        if (obj < 0) return ObjectType::Unknown;
        const H5I_type_t t = H5Iget_type(obj);
        detail::check_h5(H5Oclose(obj), "H5Oclose: " + name);
        switch (t) {
            case H5I_GROUP:   return ObjectType::Group;
            case H5I_DATASET: return ObjectType::Dataset;
            default:          return ObjectType::Unknown;
        }
    }

    STMAP_NODISCARD std::string read_attr_string(const std::string& name) const {
        return Attribute(_id, name).read_string();
    }

    void write_attr_string(const std::string& name, const std::string& value) {
        if (has_attr(name)) {
            detail::check_h5(H5Adelete(_id, name.c_str()), "H5Adelete: " + name);
        }
        Datatype type = Datatype::string_vlen();
        Attribute attr = Attribute::create(_id, name, type, Dataspace::scalar());
        const char* ptr = value.c_str();
        detail::check_h5(H5Awrite(attr.id(), type.id(), &ptr), "H5Awrite string: " + name);
    }

    template <typename T>
    STMAP_NODISCARD std::vector<T> read_attr_array(const std::string& name) const {
        return Attribute(_id, name).read_vector<T>();
    }

    template <typename T>
    void write_attr_array(const std::string& name, const std::vector<T>& values) {
        if (has_attr(name)) {
            detail::check_h5(H5Adelete(_id, name.c_str()), "H5Adelete: " + name);
        }
        Datatype type = Datatype::adopt(H5Tcopy(detail::native_type<T>()));
        Attribute attr = Attribute::create(_id, name, type,
                                           Dataspace({static_cast<hsize_t>(values.size())}));
        if (!values.empty()) {
            attr.write(values.data());
        }
    }

    STMAP_NODISCARD Dataset open_dataset(const std::string& name) const {
        return Dataset(_id, name);
    }

    template <typename T>
    void write_dataset(const std::string& name, const T* data, const std::vector<hsize_t>& dims) {
        Dataset dset = Dataset::create<T>(_id, name, dims);
        hsize_t n = 1;
        for (hsize_t d : dims) n *= d;
        if (n > 0) {
            dset.write(data);
        }
    }

    template <typename T>
    void write_dataset(const std::string& name, const std::vector<T>& data) {
        write_dataset(name, data.data(), {static_cast<hsize_t>(data.size())});
    }

    template <typename T>
    STMAP_NODISCARD std::vector<T> read_dataset(const std::string& name) const {
        return open_dataset(name).read_vector<T>();
    }

    // Stored as variable-length UTF-8 strings
    void write_strings(const std::string& name, const std::vector<std::string>& values) {
        Datatype type = Datatype::string_vlen();
        Dataset dset = Dataset::create(_id, name, type,
                                       Dataspace({static_cast<hsize_t>(values.size())}));
        if (values.empty()) return;

        std::vector<const char*> ptrs;
        ptrs.reserve(values.size());
        for (const auto& v : values) {
            ptrs.push_back(v.c_str());
        }
        detail::check_h5(H5Dwrite(dset.id(), type.id(), H5S_ALL, H5S_ALL, H5P_DEFAULT, ptrs.data()),
                         "H5Dwrite strings: " + name);
    }

    STMAP_NODISCARD std::vector<std::string> read_strings(const std::string& name) const {
        return open_dataset(name).read_strings();
    }
};

// =============================================================================
// Group / File
// =============================================================================

class Group : public Location {
public:
    Group(hid_t loc_id, const std::string& name)
        : Location(H5Gopen2(loc_id, name.c_str(), H5P_DEFAULT), H5Gclose)
    {
        detail::check_id(_id, "H5Gopen: " + name);
    }

    static Group create(hid_t loc_id, const std::string& name) {
        hid_t id = H5Gcreate2(loc_id, name.c_str(), H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        detail::check_id(id, "H5Gcreate: " + name);
        return Group(id);
    }

    Group create_group(const std::string& name) { return Group::create(_id, name); }
    STMAP_NODISCARD Group open_group(const std::string& name) const { return Group(_id, name); }

private:
    explicit Group(hid_t id) : Location(id, H5Gclose) {}
};

class File : public Location {
public:
    // Opens an existing file; FileNotFoundError when the path does not exist
    explicit File(const std::string& path, unsigned flags = H5F_ACC_RDONLY)
        : Location(open_existing(path, flags), H5Fclose) {}

    // Creates (truncates) a file
    static File create(const std::string& path) {
        hid_t id = H5Fcreate(path.c_str(), H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
        if (id < 0) {
            throw WriteError("HDF5: cannot create '" + path + "'");
        }
        return File(id);
    }

    Group create_group(const std::string& name) { return Group::create(_id, name); }
    STMAP_NODISCARD Group open_group(const std::string& name) const { return Group(_id, name); }

    void flush() {
        detail::check_h5(H5Fflush(_id, H5F_SCOPE_GLOBAL), "H5Fflush");
    }

private:
    explicit File(hid_t id) : Location(id, H5Fclose) {}

    static hid_t open_existing(const std::string& path, unsigned flags) {
        if (!std::filesystem::exists(path)) {
            throw FileNotFoundError(path);
        }
        hid_t id = H5Fopen(path.c_str(), flags, H5P_DEFAULT);
        if (id < 0) {
            throw ReadError("HDF5: cannot open '" + path + "'");
        }
        return id;
    }
};

} // namespace stmap::io::h5

#endif // STMAP_HAS_HDF5

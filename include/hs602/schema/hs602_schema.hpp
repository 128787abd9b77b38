#pragma once
// hs602_schema.hpp (C++17, header-only)
// -----------------------------------------------------------------------------
// Declarative description of fixed-layout binary records: a struct, an ordered
// tuple of fields (member pointer + wire codec + validators), and an optional
// whole-record rule. decode() and encode() walk the tuple, so the layout is
// written once and both directions stay in step.
//
//   struct Hdr { uint8_t op; uint16_t len; };
//   inline const auto hdrSchema = makeSchema<Hdr>(std::make_tuple(
//       field<&Hdr::op >("op" , LeU8{}, OneOf<0x01, 0x02>{}),
//       field<&Hdr::len>("len", LeU16{}, AtMost<1024>{})));
//   auto hdr = decode(hdrSchema, ByteView(data, size));
//
// All integers on the HS602 wire are little-endian.
// -----------------------------------------------------------------------------

#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

#include <tl/expected.hpp>

namespace hs602::schema {

template<class T, class E>
using expected = tl::expected<T, E>;
template<class E>
using unexpected = tl::unexpected<E>;

// Read-only byte slice that is consumed from the front while decoding.
struct ByteView {
    const std::uint8_t* ptr = nullptr;
    std::size_t len = 0;

    ByteView() = default;
    ByteView(const std::uint8_t* p, std::size_t n) : ptr(p), len(n) {}

    std::size_t size() const { return len; }
    const std::uint8_t* data() const { return ptr; }
    std::uint8_t operator[](std::size_t i) const { return ptr[i]; }

    ByteView subspan(std::size_t n) const {
        if (n > len) return {};
        return ByteView(ptr + n, len - n);
    }
};

// Where decoding stopped and why.
struct DecodeError {
    enum class Kind { Truncated, Invalid };

    Kind kind = Kind::Invalid;
    std::string where;
    std::string what;
};

inline unexpected<DecodeError> truncated(const char* where, const char* what) {
    return unexpected<DecodeError>(DecodeError{DecodeError::Kind::Truncated, where, what});
}

inline unexpected<DecodeError> invalid(const char* where, std::string what) {
    return unexpected<DecodeError>(DecodeError{DecodeError::Kind::Invalid, where, std::move(what)});
}

// ============================================================================
// Little-endian codecs
// ============================================================================
template<class UInt>
struct LeUInt {
    static constexpr std::size_t width = sizeof(UInt);

    expected<UInt, DecodeError> read(ByteView& s, const char* where) const {
        if (s.size() < width) return truncated(where, "not enough bytes");
        UInt v = 0;
        for (std::size_t i = 0; i < width; ++i) {
            v = static_cast<UInt>(v | (static_cast<UInt>(s[i]) << (8 * i)));
        }
        s = s.subspan(width);
        return v;
    }

    void write(UInt v, std::vector<std::uint8_t>& out) const {
        for (std::size_t i = 0; i < width; ++i) {
            out.push_back(static_cast<std::uint8_t>((v >> (8 * i)) & 0xFFu));
        }
    }
};

using LeU8  = LeUInt<std::uint8_t>;
using LeU16 = LeUInt<std::uint16_t>;
using LeU32 = LeUInt<std::uint32_t>;

// ============================================================================
// Field validators
// ============================================================================

// Raw value must be one of the listed codes (opcode tables are sparse).
template<unsigned... Allowed>
struct OneOf {
    template<class U>
    expected<void, DecodeError> operator()(const char* where, const U& raw) const {
        if (((static_cast<unsigned>(raw) == Allowed) || ...)) return {};
        std::ostringstream msg;
        msg << "unrecognised value 0x" << std::hex << static_cast<unsigned>(raw);
        return invalid(where, msg.str());
    }
};

template<unsigned Max>
struct AtMost {
    template<class U>
    expected<void, DecodeError> operator()(const char* where, const U& raw) const {
        if (static_cast<unsigned>(raw) <= Max) return {};
        std::ostringstream msg;
        msg << "value " << static_cast<unsigned>(raw) << " exceeds " << Max;
        return invalid(where, msg.str());
    }
};

template<unsigned Expected>
struct Equals {
    template<class U>
    expected<void, DecodeError> operator()(const char* where, const U& raw) const {
        if (static_cast<unsigned>(raw) == Expected) return {};
        return invalid(where, "reserved field must be " + std::to_string(Expected));
    }
};

// ============================================================================
// Field descriptor
// ============================================================================
template<auto MemberPtr, class Codec, class... Validators>
struct Field {
    static constexpr auto memberPtr = MemberPtr;
    const char* name;
    Codec codec;
    std::tuple<Validators...> validators;
};

template<auto MemberPtr, class Codec, class... Validators>
Field<MemberPtr, Codec, Validators...>
field(const char* name, Codec c, Validators... vs) {
    return { name, c, std::tuple<Validators...>{vs...} };
}

// ============================================================================
// Schema
// ============================================================================
template<class T>
struct AcceptAll {
    expected<void, DecodeError> operator()(const T&) const { return {}; }
};

template<class T, class FieldsTuple, class RecordRule>
struct Schema {
    FieldsTuple fields;
    RecordRule rule;
};

template<class T, class... FieldDescs>
Schema<T, std::tuple<FieldDescs...>, AcceptAll<T>>
makeSchema(std::tuple<FieldDescs...> fds) {
    return { std::move(fds), AcceptAll<T>{} };
}

template<class T, class... FieldDescs, class Rule>
Schema<T, std::tuple<FieldDescs...>, Rule>
makeSchema(std::tuple<FieldDescs...> fds, Rule rule) {
    return { std::move(fds), std::move(rule) };
}

namespace detail {

template<class T, bool IsEnum = std::is_enum<T>::value>
struct Raw { using type = T; };

template<class T>
struct Raw<T, true> { using type = std::underlying_type_t<T>; };

template<class T>
using raw_t = typename Raw<T>::type;

template<class FieldDesc, class V>
expected<void, DecodeError> validate(const FieldDesc& fd, const V& v) {
    const auto raw = static_cast<raw_t<V>>(v);
    expected<void, DecodeError> result{};
    std::apply([&](auto const&... check){
        ( [&]{
            if (!result) return;
            auto r = check(fd.name, raw);
            if (!r) result = unexpected<DecodeError>(r.error());
        }(), ... );
    }, fd.validators);
    return result;
}

} // namespace detail

// Decodes one record from the front of `bytes`; `bytes` is advanced past it.
template<class T, class FieldsTuple, class RecordRule>
expected<T, DecodeError>
decode(const Schema<T, FieldsTuple, RecordRule>& sch, ByteView& bytes) {
    T obj{};
    ByteView s = bytes;
    expected<void, DecodeError> status{};

    std::apply([&](auto const&... fd){
        ( [&]{
            if (!status) return;
            using MemberT = std::remove_reference_t<decltype(obj.*(fd.memberPtr))>;

            auto raw = fd.codec.read(s, fd.name);
            if (!raw) { status = unexpected<DecodeError>(raw.error()); return; }
            if (auto ok = detail::validate(fd, *raw); !ok) { status = ok; return; }
            obj.*(fd.memberPtr) = static_cast<MemberT>(*raw);
        }(), ... );
    }, sch.fields);

    if (!status) return unexpected<DecodeError>(status.error());
    if (auto ok = sch.rule(obj); !ok) return unexpected<DecodeError>(ok.error());

    bytes = s;
    return obj;
}

template<class T, class FieldsTuple, class RecordRule>
expected<void, DecodeError>
encode(const Schema<T, FieldsTuple, RecordRule>& sch, const T& obj, std::vector<std::uint8_t>& out) {
    if (auto ok = sch.rule(obj); !ok) return ok;

    expected<void, DecodeError> status{};
    std::apply([&](auto const&... fd){
        ( [&]{
            if (!status) return;
            const auto& v = obj.*(fd.memberPtr);
            if (auto ok = detail::validate(fd, v); !ok) { status = ok; return; }
            fd.codec.write(static_cast<detail::raw_t<std::decay_t<decltype(v)>>>(v), out);
        }(), ... );
    }, sch.fields);
    return status;
}

} // namespace hs602::schema

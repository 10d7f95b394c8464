#pragma once

#include <canonical_cbor/cbor/types/array.hpp>
#include <canonical_cbor/cbor/types/integer.hpp>
#include <canonical_cbor/cbor/types/map.hpp>
#include <canonical_cbor/cbor/types/simple.hpp>
#include <canonical_cbor/cbor/types/string.hpp>
#include <canonical_cbor/cbor/types/tag.hpp>

#include <canonical_cbor/util.hpp>

#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ccb {

template <typename TDestination, typename TVariant, size_t... TVariantAlternativeTypeIs>
constexpr bool is_convertible_from_variant_alternative_type_helper(
    std::index_sequence<TVariantAlternativeTypeIs...>
) {
    return (std::is_convertible_v<std::variant_alternative_t<TVariantAlternativeTypeIs, TVariant>, TDestination> || ...);
}

template <typename TDestination, typename TVariant, typename Indices = std::make_index_sequence<std::variant_size_v<TVariant>>>
constexpr bool is_convertible_from_variant_alternative_type() {
    return is_convertible_from_variant_alternative_type_helper<TDestination, TVariant>(
        Indices{}
    );
}

template <typename TDestination, typename TVariant>
struct cbor_value_converter {
    template <typename TSource, enable_if_convertible_without_cvref<TSource, TDestination> = 0>
    TDestination operator()(const TSource& value) const {
        return value;
    }

    template <typename TSource,
        std::enable_if_t<
            ! std::is_convertible_v<remove_cvref_t<TSource>, TDestination> &&
                is_convertible_from_variant_alternative_type<TDestination, TVariant>(),
            int
        > = 0>
    TDestination operator()(const TSource& value) const {
        throw std::runtime_error("Bad type cast");
    }
};

enum class cbor_value_type {
    integer,
    byte_string,
    text_string,
    array,
    map,
    tag,
    simple,
};

struct cbor_value_type_discoverer {
    cbor_value_type operator()(const cbor_integer& value) const { return cbor_value_type::integer; }
    cbor_value_type operator()(const cbor_byte_string& value) const { return cbor_value_type::byte_string; }
    cbor_value_type operator()(const cbor_text_string& value) const { return cbor_value_type::text_string; }
    cbor_value_type operator()(const cbor_array& value) const { return cbor_value_type::array; }
    cbor_value_type operator()(const cbor_map& value) const { return cbor_value_type::map; }
    cbor_value_type operator()(const cbor_tag& value) const { return cbor_value_type::tag; }
    cbor_value_type operator()(const cbor_simple& value) const { return cbor_value_type::simple; }
};

// Based on https://stackoverflow.com/a/45898325
template <typename T, typename... VariantTypes>
struct is_convertible_to_variant_alternative_type;

template <typename T, typename... VariantTypes>
struct is_convertible_to_variant_alternative_type<T, std::variant<VariantTypes...>> {
    static constexpr bool value = (std::is_convertible_v<remove_cvref_t<T>, remove_cvref_t<VariantTypes>> || ...);
};

template <typename T, typename... VariantTypes>
inline constexpr bool is_convertible_to_variant_alternative_type_v =
    is_convertible_to_variant_alternative_type<T, VariantTypes...>::value;

class cbor_value {
public:
    using storage_type = std::variant<
        cbor_integer,
        cbor_byte_string,
        cbor_text_string,
        cbor_array,
        cbor_map,
        cbor_tag,
        cbor_simple
    >;

    cbor_value() : _storage(cbor_simple::null()) {}

    template <typename T, std::enable_if_t<is_convertible_to_variant_alternative_type_v<T, storage_type>, int> = 0>
    cbor_value(T&& value) : _storage(std::forward<T>(value)) {}

    COPYABLE(cbor_value);
    MOVABLE(cbor_value);

    template <typename T>
    T get() const {
        return std::visit(cbor_value_converter<T, storage_type>{}, _storage);
    }

    cbor_value_type type() const {
        return std::visit(cbor_value_type_discoverer{}, _storage);
    }

    // The 3-bit CBOR major type this value is written with
    uint8_t major_type() const;

    template <typename TVisitor>
    decltype(auto) visit(TVisitor&& visitor) const& {
        return std::visit(std::forward<TVisitor>(visitor), _storage);
    }

    template <typename TVisitor>
    decltype(auto) visit(TVisitor&& visitor) && {
        return std::visit(std::forward<TVisitor>(visitor), std::move(_storage));
    }

    std::string dump_debug() const;
    void dump_debug(std::stringstream& ss) const;

    template <typename T> explicit operator T() const { return get<T>(); }

    bool operator==(const cbor_value& rhs) const;

private:
    storage_type _storage;
};

}  // namespace ccb

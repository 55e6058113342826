/**
 * @file schema.cpp
 * @brief Record schema table and assembler.
 */

#include <doves/decoder.hpp>
#include <doves/schema.hpp>

#include <array>
#include <utility>

namespace doves {

namespace {

/* Field decoders, parameterised by the Ring member they fill */

template <auto Member>
Error text_field(std::string_view raw, Ring& ring, const DecodeOptions&, std::string_view&) {
    ring.*Member = std::string(raw);
    return Error::Ok;
}

template <auto Member>
Error optional_text_field(std::string_view raw, Ring& ring, const DecodeOptions&,
                          std::string_view&) {
    if (!raw.empty()) {
        ring.*Member = std::string(raw);
    }
    return Error::Ok;
}

template <auto Member>
Error presence_field(std::string_view raw, Ring& ring, const DecodeOptions&, std::string_view&) {
    ring.*Member = decode_presence(raw);
    return Error::Ok;
}

template <auto Member>
Error unsigned_field(std::string_view raw, Ring& ring, const DecodeOptions&, std::string_view&) {
    return decode_unsigned(raw, ring.*Member);
}

template <auto Member>
Error optional_unsigned_field(std::string_view raw, Ring& ring, const DecodeOptions&,
                              std::string_view&) {
    if (raw.empty()) {
        return Error::Ok;
    }
    std::uint64_t value = 0;
    auto result = decode_unsigned(raw, value);
    if (result == Error::Ok) {
        ring.*Member = value;
    }
    return result;
}

template <auto Member>
Error optional_number_field(std::string_view raw, Ring& ring, const DecodeOptions&,
                            std::string_view&) {
    if (raw.empty()) {
        return Error::Ok;
    }
    double value = 0.0;
    auto result = decode_number(raw, value);
    if (result == Error::Ok) {
        ring.*Member = value;
    }
    return result;
}

Error ring_type_field(std::string_view raw, Ring& ring, const DecodeOptions&, std::string_view&) {
    return decode_ring_type(raw, ring.ring_type);
}

Error details_field(std::string_view raw, Ring& ring, const DecodeOptions&, std::string_view&) {
    if (raw.empty()) {
        return Error::Ok;
    }
    Details details = Details::P;
    auto result = decode_details(raw, details);
    if (result == Error::Ok) {
        ring.details = details;
    }
    return result;
}

Error weight_field(std::string_view raw, Ring& ring, const DecodeOptions& options,
                   std::string_view&) {
    return decode_weight(raw, ring.weight, options);
}

Error note_field(std::string_view raw, Ring& ring, const DecodeOptions& options,
                 std::string_view&) {
    return decode_pitch(raw, ring.note, options);
}

Error affiliations_field(std::string_view raw, Ring& ring, const DecodeOptions&,
                         std::string_view& offending) {
    return decode_affiliations(raw, ring.affiliations, &offending);
}

Error extra_info_field(std::string_view raw, Ring& ring, const DecodeOptions&,
                       std::string_view&) {
    ring.extra_info = decode_list(raw);
    return Error::Ok;
}

// clang-format off
constexpr std::array SCHEMA{
    // Mandatory
    FieldSpec{"TowerID",     true,  unsigned_field<&Ring::id>},
    FieldSpec{"RingType",    true,  ring_type_field},
    FieldSpec{"Bells",       true,  unsigned_field<&Ring::bells>},
    FieldSpec{"UR",          true,  presence_field<&Ring::unringable>},
    FieldSpec{"GF",          true,  presence_field<&Ring::ground_floor>},
    FieldSpec{"Toilet",      true,  presence_field<&Ring::toilet>},
    FieldSpec{"Simulator",   true,  presence_field<&Ring::simulator>},
    FieldSpec{"App",         true,  presence_field<&Ring::app>},
    FieldSpec{"Wt",          true,  weight_field},
    FieldSpec{"Place",       true,  text_field<&Ring::place>},
    FieldSpec{"Dedicn",      true,  text_field<&Ring::dedication>},

    // Optional
    FieldSpec{"Affiliations", false, affiliations_field},
    FieldSpec{"ExtraInfo",    false, extra_info_field},
    FieldSpec{"Note",         false, note_field},
    FieldSpec{"Hz",           false, optional_number_field<&Ring::frequency>},
    FieldSpec{"Details",      false, details_field},
    FieldSpec{"TowerBase",    false, optional_unsigned_field<&Ring::towerbase_id>},
    FieldSpec{"DoveID",       false, optional_text_field<&Ring::dove_id>},
    FieldSpec{"Practice",     false, optional_text_field<&Ring::practice>},
    FieldSpec{"WebPage",      false, optional_text_field<&Ring::url>},
    FieldSpec{"Semitones",    false, optional_text_field<&Ring::semitones>},
    FieldSpec{"Place2",       false, optional_text_field<&Ring::place2>},
    FieldSpec{"PlaceCL",      false, optional_text_field<&Ring::place_county_list>},
    FieldSpec{"County",       false, optional_text_field<&Ring::county>},
    FieldSpec{"Country",      false, optional_text_field<&Ring::country>},
    FieldSpec{"ISO3166code",  false, optional_text_field<&Ring::iso_3166_code>},
    FieldSpec{"NG",           false, optional_text_field<&Ring::os_grid_ref>},
    FieldSpec{"Postcode",     false, optional_text_field<&Ring::postcode>},
    FieldSpec{"Long",         false, optional_number_field<&Ring::longitude>},
    FieldSpec{"Lat",          false, optional_number_field<&Ring::latitude>},
    FieldSpec{"SNLong",       false, optional_number_field<&Ring::satnav_longitude>},
    FieldSpec{"SNLat",        false, optional_number_field<&Ring::satnav_latitude>},
    FieldSpec{"OvhaulYr",     false, optional_unsigned_field<&Ring::overhaul_year>},
    FieldSpec{"Contractor",   false, optional_text_field<&Ring::contractor>},
    FieldSpec{"TuneYr",       false, optional_unsigned_field<&Ring::tune_year>},
    FieldSpec{"BldgID",       false, optional_unsigned_field<&Ring::building_id>},
    FieldSpec{"LGrade",       false, optional_text_field<&Ring::building_grade>},
    FieldSpec{"ChurchCare",   false, optional_unsigned_field<&Ring::church_care>},
    FieldSpec{"AltName",      false, optional_text_field<&Ring::alt_name>},
    FieldSpec{"Diocese",      false, optional_text_field<&Ring::diocese>},
};
// clang-format on

} // namespace

std::span<const FieldSpec> record_schema() noexcept {
    return SCHEMA;
}

const FieldSpec* find_field(std::string_view name) noexcept {
    for (const auto& field : SCHEMA) {
        if (field.name == name) {
            return &field;
        }
    }
    return nullptr;
}

Error assemble_ring(const RawRecord& raw, Ring& out, std::vector<DecodeError>& errors,
                    const DecodeOptions& options) {
    errors.clear();

    for (const auto& [name, value] : raw) {
        if (find_field(name) == nullptr) {
            errors.push_back({Error::UnknownField, name, name});
        }
    }

    Ring ring;
    for (const auto& field : SCHEMA) {
        auto it = raw.find(field.name);
        if (it == raw.end() || !it->second.has_value()) {
            if (field.required) {
                errors.push_back({Error::MissingField, std::string(field.name), {}});
            }
            continue;
        }

        std::string_view text = *it->second;
        std::string_view offending = text;
        auto result = field.decode(text, ring, options, offending);
        if (result != Error::Ok) {
            errors.push_back({result, std::string(field.name), std::string(offending)});
        }
    }

    if (!errors.empty()) {
        return errors.front().kind;
    }

    out = std::move(ring);
    return Error::Ok;
}

#if !DOVES_NO_EXCEPTIONS

Ring decode_ring(const RawRecord& raw, const DecodeOptions& options) {
    Ring ring;
    std::vector<DecodeError> errors;
    if (assemble_ring(raw, ring, errors, options) != Error::Ok) {
        throw RecordException(std::move(errors));
    }
    return ring;
}

#endif // !DOVES_NO_EXCEPTIONS

} // namespace doves

/**
 * @file ring.hpp
 * @brief Decoded Dove's Guide ring record.
 *
 * One Ring per data row of the export. A tower may hold several rings;
 * each row still carries the tower's identifier.
 */

#ifndef DOVES_RING_HPP
#define DOVES_RING_HPP

#include "affiliation.hpp"
#include "error.hpp"
#include "note.hpp"
#include "weight.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace doves {

/**
 * @brief Kind of ring.
 *
 * Export tags: "Full circle ring", "Carillon".
 */
enum class RingType { FullCircle, Carillon };

/**
 * @brief Record detail class. Export tags: "P", "C".
 */
enum class Details { P, C };

/**
 * @brief Match a ring type tag exactly.
 * @return Error::Ok, or Error::UnknownVariant
 */
Error decode_ring_type(std::string_view raw, RingType& out) noexcept;

/**
 * @brief Match a details tag exactly.
 * @return Error::Ok, or Error::UnknownVariant
 */
Error decode_details(std::string_view raw, Details& out) noexcept;

/// Export tag of a ring type
std::string_view to_string(RingType type) noexcept;

/// Export tag of a details value
std::string_view to_string(Details details) noexcept;

/**
 * @brief A ring of bells as published in Dove's Guide.
 *
 * Built once by assemble_ring() and not modified afterwards; the
 * collection hands out const references only.
 */
struct Ring {
    /* Identity and classification */

    /// Dove's tower ID (`TowerID`). Unique per tower, never reused.
    std::uint64_t id = 0;
    RingType ring_type = RingType::FullCircle;
    std::uint64_t bells = 0;
    /// `UR`: the bells cannot be safely rung
    bool unringable = false;
    /// `GF`: rung from the ground floor
    bool ground_floor = false;
    /// `Toilet`: toilet facilities available
    bool toilet = false;
    /// `Simulator`: can be rung silently with a simulator
    bool simulator = false;
    /// `App`
    bool app = false;
    std::optional<Details> details;
    /// TowerBase identifier; not unique across rings
    std::optional<std::uint64_t> towerbase_id;
    /// Deprecated text identifier, superseded by `id`
    std::optional<std::string> dove_id;

    /* Set-valued metadata */

    AffiliationSet affiliations;
    /// `ExtraInfo`, split literally on ';'
    std::optional<std::vector<std::string>> extra_info;

    /* Physical and musical */

    Weight weight;
    std::optional<Pitch> note;
    /// Frequency of the heaviest bell in Hz
    std::optional<double> frequency;
    /// '+'-delimited semitone bells, kept as published
    std::optional<std::string> semitones;

    /* Place and building */

    std::string place;
    std::optional<std::string> place2;
    std::optional<std::string> place_county_list;
    std::optional<std::string> county;
    std::optional<std::string> country;
    std::optional<std::string> iso_3166_code;
    std::optional<std::string> os_grid_ref;
    std::optional<std::string> postcode;
    std::optional<double> longitude;
    std::optional<double> latitude;
    std::optional<double> satnav_longitude;
    std::optional<double> satnav_latitude;
    std::string dedication;
    std::optional<std::string> alt_name;
    std::optional<std::string> diocese;
    std::optional<std::uint64_t> building_id;
    std::optional<std::string> building_grade;
    std::optional<std::uint64_t> church_care;

    /* Practice and maintenance */

    std::optional<std::string> practice;
    std::optional<std::string> url;
    std::optional<std::uint64_t> overhaul_year;
    std::optional<std::string> contractor;
    std::optional<std::uint64_t> tune_year;

    friend bool operator==(const Ring&, const Ring&) = default;
};

} // namespace doves

#endif // DOVES_RING_HPP

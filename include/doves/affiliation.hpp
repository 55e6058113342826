/**
 * @file affiliation.hpp
 * @brief Ringing organisations a tower can be affiliated to.
 *
 * The vocabulary is a closed, versioned table mapping each code used in
 * the export to an Affiliation value. Adding an organisation means
 * adding an enumerator and a table row; decoding never changes.
 *
 * Codes whose organisation name is not confirmed carry the code itself
 * as display name.
 */

#ifndef DOVES_AFFILIATION_HPP
#define DOVES_AFFILIATION_HPP

#include <array>
#include <bitset>
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace doves {

/// Bumped whenever a code is added to or removed from the table
inline constexpr int AFFILIATION_VOCABULARY_VERSION = 1;

/**
 * @brief An organisation to which a tower can be affiliated.
 *
 * Enumerator order must match AFFILIATIONS.
 */
enum class Affiliation {
    /* University societies */
    CambridgeUni,
    ManchesterUni,
    OxfordUni,
    BristolUni,
    LondonUni,
    LiverpoolUnis,

    /* Non-territorial societies */
    CollegeYouths,
    CumberlandYouths,
    StMartinsGuild,
    DevonshireRingers,
    BeverleyDistrict,
    EastGrinstead,
    LichfieldWalsall,
    OxfordSociety,
    Lundy,

    /* Territorial associations and guilds */
    OxfordDiocese,
    Surrey,
    GuildfordDiocese,
    WinchesterPortsmouth,
    Hertford,
    HerefordDiocese,
    Cea,
    Yorkshire,
    Suffolk,
    EastDerbyshireWestNotts,
    LincolnDiocese,
    LlandaffMonmouth,
    NorwichDiocese,
    Essex,
    LeicesterDiocese,
    Ely,
    Lancashire,
    TruroDiocese,
    Bedfordshire,
    GloucesterBristol,
    Southwell,
    BathWells,
    CarlisleDiocese,
    Sussex,
    NorthStaffordshire,
    Ecba,
    DerbyDiocese,
    Salisbury,
    PeterboroughDiocese,
    NorthWales,
    CoventryDiocese,
    Middlesex,
    Shropshire,
    ChesterDiocese,
    DurhamNewcastle,
    Worcestershire,
    Dca,
    Devon,
    StDavidsDiocese,
    Kent,
    Scotland,
    SwanseaBrecon,
    Ireland,

    /* Overseas */
    Anzab,
    NorthAmerica,
    SouthAfrica,
    Zimbabwe,
};

/**
 * @brief One row of the vocabulary table.
 */
struct AffiliationEntry {
    Affiliation value;
    std::string_view code;
    std::string_view name;
};

// clang-format off
inline constexpr std::array AFFILIATIONS{
    AffiliationEntry{Affiliation::CambridgeUni,            "CUG",   "Cambridge University Guild"},
    AffiliationEntry{Affiliation::ManchesterUni,           "MUG",   "Manchester University Guild"},
    AffiliationEntry{Affiliation::OxfordUni,               "OUS",   "Oxford University Society"},
    AffiliationEntry{Affiliation::BristolUni,              "UBSCR", "University of Bristol Society"},
    AffiliationEntry{Affiliation::LondonUni,               "ULSCR", "University of London Society"},
    AffiliationEntry{Affiliation::LiverpoolUnis,           "LivUS", "Liverpool Universities Society"},
    AffiliationEntry{Affiliation::CollegeYouths,           "ASCY",  "Ancient Society of College Youths"},
    AffiliationEntry{Affiliation::CumberlandYouths,        "SRCY",  "Society of Royal Cumberland Youths"},
    AffiliationEntry{Affiliation::StMartinsGuild,          "SMB",   "St Martin's Guild, Birmingham"},
    AffiliationEntry{Affiliation::DevonshireRingers,       "GDR",   "Guild of Devonshire Ringers"},
    AffiliationEntry{Affiliation::BeverleyDistrict,        "Bev&D", "Beverley and District Ringing Society"},
    AffiliationEntry{Affiliation::EastGrinstead,           "EGDG",  "East Grinstead and District Guild"},
    AffiliationEntry{Affiliation::LichfieldWalsall,        "LWAS",  "Lichfield and Walsall Archdeaconries Society"},
    AffiliationEntry{Affiliation::OxfordSociety,           "OS",    "Oxford Society"},
    AffiliationEntry{Affiliation::Lundy,                   "Lundy", "Lundy"},
    AffiliationEntry{Affiliation::OxfordDiocese,           "ODG",   "Oxford Diocesan Guild"},
    AffiliationEntry{Affiliation::Surrey,                  "Surr",  "Surrey Association"},
    AffiliationEntry{Affiliation::GuildfordDiocese,        "GDG",   "Guildford Diocesan Guild"},
    AffiliationEntry{Affiliation::WinchesterPortsmouth,    "W&P",   "Winchester and Portsmouth Diocesan Guild"},
    AffiliationEntry{Affiliation::Hertford,                "HCA",   "Hertford County Association"},
    AffiliationEntry{Affiliation::HerefordDiocese,         "HDG",   "Hereford Diocesan Guild"},
    AffiliationEntry{Affiliation::Cea,                     "CEA",   "CEA"},
    AffiliationEntry{Affiliation::Yorkshire,               "YACR",  "Yorkshire Association"},
    AffiliationEntry{Affiliation::Suffolk,                 "Suff",  "Suffolk Guild"},
    AffiliationEntry{Affiliation::EastDerbyshireWestNotts, "EDWNA", "East Derbyshire and West Nottinghamshire Association"},
    AffiliationEntry{Affiliation::LincolnDiocese,          "LinDG", "Lincoln Diocesan Guild"},
    AffiliationEntry{Affiliation::LlandaffMonmouth,        "L&M",   "Llandaff and Monmouth Diocesan Association"},
    AffiliationEntry{Affiliation::NorwichDiocese,          "NDA",   "Norwich Diocesan Association"},
    AffiliationEntry{Affiliation::Essex,                   "Essex", "Essex Association"},
    AffiliationEntry{Affiliation::LeicesterDiocese,        "LeiDG", "Leicester Diocesan Guild"},
    AffiliationEntry{Affiliation::Ely,                     "Ely",   "Ely Diocesan Association"},
    AffiliationEntry{Affiliation::Lancashire,              "Lancs", "Lancashire Association"},
    AffiliationEntry{Affiliation::TruroDiocese,            "TruDG", "Truro Diocesan Guild"},
    AffiliationEntry{Affiliation::Bedfordshire,            "Beds",  "Bedfordshire Association"},
    AffiliationEntry{Affiliation::GloucesterBristol,       "G&B",   "Gloucester and Bristol Diocesan Association"},
    AffiliationEntry{Affiliation::Southwell,               "Swell", "Southwell and Nottingham Diocesan Guild"},
    AffiliationEntry{Affiliation::BathWells,               "B&W",   "Bath and Wells Diocesan Association"},
    AffiliationEntry{Affiliation::CarlisleDiocese,         "CarDG", "Carlisle Diocesan Guild"},
    AffiliationEntry{Affiliation::Sussex,                  "SuxCA", "Sussex County Association"},
    AffiliationEntry{Affiliation::NorthStaffordshire,      "NSA",   "North Staffordshire Association"},
    AffiliationEntry{Affiliation::Ecba,                    "ECBA",  "ECBA"},
    AffiliationEntry{Affiliation::DerbyDiocese,            "DDA",   "Derby Diocesan Association"},
    AffiliationEntry{Affiliation::Salisbury,               "Salis", "Salisbury Diocesan Guild"},
    AffiliationEntry{Affiliation::PeterboroughDiocese,     "PDG",   "Peterborough Diocesan Guild"},
    AffiliationEntry{Affiliation::NorthWales,              "NWA",   "North Wales Association"},
    AffiliationEntry{Affiliation::CoventryDiocese,         "CovDG", "Coventry Diocesan Guild"},
    AffiliationEntry{Affiliation::Middlesex,               "Middx", "Middlesex County Association"},
    AffiliationEntry{Affiliation::Shropshire,              "Salop", "Shropshire Association"},
    AffiliationEntry{Affiliation::ChesterDiocese,          "CheDG", "Chester Diocesan Guild"},
    AffiliationEntry{Affiliation::DurhamNewcastle,         "D&N",   "Durham and Newcastle Diocesan Association"},
    AffiliationEntry{Affiliation::Worcestershire,          "WDA",   "Worcestershire and Districts Association"},
    AffiliationEntry{Affiliation::Dca,                     "DCA",   "DCA"},
    AffiliationEntry{Affiliation::Devon,                   "DevAs", "Devon Association"},
    AffiliationEntry{Affiliation::StDavidsDiocese,         "SDDG",  "St David's Diocesan Guild"},
    AffiliationEntry{Affiliation::Kent,                    "KCA",   "Kent County Association"},
    AffiliationEntry{Affiliation::Scotland,                "Scot",  "Scottish Association"},
    AffiliationEntry{Affiliation::SwanseaBrecon,           "S&B",   "Swansea and Brecon Diocesan Guild"},
    AffiliationEntry{Affiliation::Ireland,                 "Irish", "Irish Association"},
    AffiliationEntry{Affiliation::Anzab,                   "ANZAB", "Australian and New Zealand Association"},
    AffiliationEntry{Affiliation::NorthAmerica,            "NAG",   "North American Guild"},
    AffiliationEntry{Affiliation::SouthAfrica,             "SAG",   "South African Guild"},
    AffiliationEntry{Affiliation::Zimbabwe,                "Zimb",  "Zimbabwe Guild"},
};
// clang-format on

inline constexpr std::size_t AFFILIATION_COUNT = AFFILIATIONS.size();

namespace detail {

constexpr bool table_is_ordered() noexcept {
    for (std::size_t i = 0; i < AFFILIATION_COUNT; ++i) {
        if (static_cast<std::size_t>(AFFILIATIONS[i].value) != i) {
            return false;
        }
    }
    return true;
}

} // namespace detail

static_assert(detail::table_is_ordered(), "AFFILIATIONS must follow enumerator order");

/**
 * @brief Code used for an affiliation in the export, e.g. "ODG".
 */
inline std::string_view affiliation_code(Affiliation value) noexcept {
    return AFFILIATIONS[static_cast<std::size_t>(value)].code;
}

/**
 * @brief Display name of an affiliation.
 */
inline std::string_view affiliation_name(Affiliation value) noexcept {
    return AFFILIATIONS[static_cast<std::size_t>(value)].name;
}

/**
 * @brief Look up an export code (case-sensitive).
 * @return The affiliation, or std::nullopt for codes outside the vocabulary
 */
std::optional<Affiliation> find_affiliation(std::string_view code) noexcept;

/**
 * @brief Set of affiliations, stored as one bit per vocabulary entry.
 */
class AffiliationSet {
public:
    AffiliationSet() noexcept = default;

    /// Insert a value; inserting twice is a no-op
    void insert(Affiliation value) noexcept {
        bits_.set(static_cast<std::size_t>(value));
    }

    [[nodiscard]] bool contains(Affiliation value) const noexcept {
        return bits_.test(static_cast<std::size_t>(value));
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return bits_.count();
    }

    [[nodiscard]] bool empty() const noexcept {
        return bits_.none();
    }

    /**
     * @brief Members in vocabulary order.
     */
    [[nodiscard]] std::vector<Affiliation> values() const;

    friend bool operator==(const AffiliationSet&, const AffiliationSet&) = default;

private:
    std::bitset<AFFILIATION_COUNT> bits_;
};

} // namespace doves

#endif // DOVES_AFFILIATION_HPP

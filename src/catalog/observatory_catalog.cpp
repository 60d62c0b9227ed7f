/// @file observatory_catalog.cpp
/// @brief Observatory catalog adapter over palObs and the MPC code side table.

#include "catalog/observatory_catalog.hpp"

#include "core/types.hpp"

extern "C"
{
#include <star/pal.h>
}

#include <array>
#include <cstddef>

namespace telesite::catalog
{

namespace
{
    // palObs buffer sizes (identifiers are at most 10 characters, names 40)
    constexpr std::size_t kIdentLength = 16;
    constexpr std::size_t kNameLength  = 64;

    ObservatoryEntry sentinel()
    {
        return ObservatoryEntry{
            .mnemonic       = std::string(ObservatoryCatalog::kSentinel),
            .full_name      = std::string(ObservatoryCatalog::kSentinel),
            .west_longitude = 0.0,
            .latitude       = 0.0,
            .altitude       = 0.0,
        };
    }

    struct CodeMapping
    {
        std::string_view mnemonic;
        std::string_view code;
    };

    // Catalog sites that share an MPC observatory code
    constexpr std::array kMpcCodes = {
        CodeMapping{"JCMT", "568"},       CodeMapping{"UKIRT", "568"},
        CodeMapping{"MAUNAK88", "568"},   CodeMapping{"KECK1", "568"},
        CodeMapping{"KECK2", "568"},      CodeMapping{"IRTF", "568"},
        CodeMapping{"CFHT", "568"},       CodeMapping{"SUBARU", "568"},
        CodeMapping{"GEMININ", "568"},    CodeMapping{"CSO", "568"},
        CodeMapping{"AAT", "413"},        CodeMapping{"ANU2.3", "413"},
        CodeMapping{"UKST", "413"},       CodeMapping{"STROMLO74", "414"},
        CodeMapping{"LPO4.2", "950"},     CodeMapping{"LPO2.5", "950"},
        CodeMapping{"LPO1", "950"},       CodeMapping{"KPNO158", "695"},
        CodeMapping{"KPNO90", "695"},     CodeMapping{"KPNO84", "695"},
        CodeMapping{"KPNO36FT", "695"},   CodeMapping{"PALOMAR200", "675"},
        CodeMapping{"PALOMAR60", "675"},  CodeMapping{"PALOMAR48", "675"},
        CodeMapping{"LICK120", "662"},    CodeMapping{"ESO3.6", "809"},
        CodeMapping{"ESONTT", "809"},     CodeMapping{"ESOSCHM", "809"},
        CodeMapping{"TOLOLO4M", "807"},   CodeMapping{"TOLOLO1.5M", "807"},
        CodeMapping{"DUPONT", "304"},     CodeMapping{"VLT1", "309"},
        CodeMapping{"VLT2", "309"},       CodeMapping{"VLT3", "309"},
        CodeMapping{"VLT4", "309"},       CodeMapping{"MMT", "696"},
        CodeMapping{"MTHOP1.5", "696"},   CodeMapping{"MCDONLD2.7", "711"},
        CodeMapping{"MCDONLD2.1", "711"}, CodeMapping{"ARECIBO", "251"},
        CodeMapping{"HPROV1.52", "511"},  CodeMapping{"HPROV1.93", "511"},
        CodeMapping{"FLAGSTF61", "689"},  CodeMapping{"LOWELL72", "690"},
        CodeMapping{"HARVARD", "801"},    CodeMapping{"QUEBEC1.6", "301"},
        CodeMapping{"KOTTAMIA", "088"},   CodeMapping{"BOSQALEGRE", "821"},
        CodeMapping{"KISO", "381"},       CodeMapping{"TAUTNBG", "033"},
        CodeMapping{"CAMB1MILE", "503"},
    };
} // namespace

bool ObservatoryEntry::is_sentinel() const
{
    return full_name == ObservatoryCatalog::kSentinel;
}

ObservatoryEntry ObservatoryCatalog::entry(i32 index)
{
    if (index < 1)
    {
        return sentinel();
    }

    std::array<char, kIdentLength> ident{};
    std::array<char, kNameLength> name{};
    f64 west = 0.0;
    f64 latitude = 0.0;
    f64 altitude = 0.0;

    // A positive index selects by number; the identifier argument is ignored
    const int status = palObs(static_cast<std::size_t>(index), "",
                              ident.data(), ident.size(), name.data(), name.size(),
                              &west, &latitude, &altitude);
    if (status != 0 || name.front() == '\0')
    {
        return sentinel();
    }

    return ObservatoryEntry{
        .mnemonic       = std::string(ident.data()),
        .full_name      = std::string(name.data()),
        .west_longitude = west,
        .latitude       = latitude,
        .altitude       = altitude,
    };
}

std::optional<ObservatoryEntry> ObservatoryCatalog::find(std::string_view mnemonic)
{
    for (i32 i = 1;; ++i)
    {
        ObservatoryEntry candidate = entry(i);
        if (candidate.is_sentinel())
        {
            return std::nullopt;
        }
        if (candidate.mnemonic == mnemonic)
        {
            return candidate;
        }
    }
}

std::optional<std::string> ObservatoryCatalog::mpc_code(std::string_view mnemonic)
{
    for (const auto& mapping : kMpcCodes)
    {
        if (mapping.mnemonic == mnemonic)
        {
            return std::string(mapping.code);
        }
    }
    return std::nullopt;
}

} // namespace telesite::catalog

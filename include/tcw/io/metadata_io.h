#pragma once
// tcw/io/metadata_io.h
//
// HazardMetadata persistence.
//
// JSON (export for downstream consumers):
//   {"event_name":..., "initialisation_time":...,
//    "leadtimes_per_country":{"<code>":{"country_name":..., "country_alpha3":...,
//        "country_alpha2":..., "median_leadtime":..., "all_leadtimes":[...]}}}
// Country annotations come from the lookup (empty when unknown).
//
// TSV (lossless round trip), header:
//   event_name  initialisation_time  country_code  median_leadtime  all_leadtimes
// one row per country, all_leadtimes separated by ';'. Metadata without
// countries is one row with empty country columns. A row without a median gets
// the unweighted median of its lead times when read.

#include "tcw/core/types.h"
#include "tcw/geography/country.h"
#include "tcw/hazard/metadata.h"

#include <string>

namespace tcw {
namespace io {

std::string MetadataToJson(const hazard::HazardMetadata& metadata, const geography::ICountryLookup* lookup);

bool WriteMetadataJson(const std::string& path,
                       const hazard::HazardMetadata& metadata,
                       const geography::ICountryLookup* lookup,
                       std::string* err = nullptr);

bool WriteMetadataTsv(const std::string& path, const hazard::HazardMetadata& metadata, std::string* err = nullptr);

bool ReadMetadataTsv(const std::string& path, hazard::HazardMetadata* out, std::string* err = nullptr);

}  // namespace io
}  // namespace tcw

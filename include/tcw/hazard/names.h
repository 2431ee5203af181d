#pragma once
// tcw/hazard/names.h
//
// Event names. Ensemble members are named "<storm>_<member>", e.g. "ELOISE_1";
// the base name is the part before the first '_'.

#include "tcw/core/types.h"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace tcw {
namespace hazard {

inline std::string BaseEventName(std::string_view member_name) {
  return std::string(member_name.substr(0, member_name.find('_')));
}

// The storm name shared by all members. No members or more than one distinct
// base name is an error.
inline bool UniqueBaseEventName(const std::vector<std::string>& member_names,
                                std::string* out,
                                std::string* err = nullptr) {
  if (!out) {
    SetErr(err, "UniqueBaseEventName: out is null");
    return false;
  }
  std::set<std::string> names;
  for (const auto& n : member_names) names.insert(BaseEventName(n));
  if (names.empty()) {
    SetErr(err, "No event names given.");
    return false;
  }
  if (names.size() > 1) {
    std::string joined;
    for (const auto& n : names) {
      if (!joined.empty()) joined += ", ";
      joined += n;
    }
    SetErr(err, "Storm name of tracks is not unique: {" + joined + "}");
    return false;
  }
  *out = *names.begin();
  return true;
}

}  // namespace hazard
}  // namespace tcw

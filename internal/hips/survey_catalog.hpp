#pragma once

#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/hips.hpp"

namespace skycache::hips {

/*
  Surveys known without asking a HiPS registry: a few recommended
  all-sky surveys plus whatever `hips.surveys` adds. A configured survey
  with the id of a built-in one replaces it.
*/
class SurveyCatalog {
 public:
  explicit SurveyCatalog(std::vector<model::HiPSSurvey> surveys = BuiltinSurveys());

  static SurveyCatalog FromConfig(const skycache::runtime::config::HipsConfig& cfg);

  static std::vector<model::HiPSSurvey> BuiltinSurveys();

  const std::vector<model::HiPSSurvey>& All() const {
    return surveys_;
  }

  const model::HiPSSurvey* Find(const std::string& id) const;

  // throws util::NotFound
  const model::HiPSSurvey& Get(const std::string& id) const;

 private:
  std::vector<model::HiPSSurvey> surveys_;
};

} // namespace skycache::hips

#include "survey_catalog.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/hips/tile_addressing.hpp"
#include "internal/util/errors.hpp"

namespace skycache::hips {

using model::HiPSSurvey;

namespace {

HiPSSurvey FromProto(const skycache::runtime::config::HipsSurveyConfig& cfg) {
  if (cfg.id().empty() || cfg.url().empty()) {
    throw std::invalid_argument("hips survey requires id and url");
  }
  if (cfg.max_order() > static_cast<std::uint32_t>(kMaxHipsOrder)) {
    throw std::invalid_argument("hips survey '" + cfg.id() + "' max_order exceeds " + std::to_string(kMaxHipsOrder));
  }

  HiPSSurvey survey;
  survey.id          = cfg.id();
  survey.name        = cfg.name().empty() ? cfg.id() : cfg.name();
  survey.url         = cfg.url();
  survey.max_order   = cfg.max_order() > 0 ? static_cast<int>(cfg.max_order()) : 11;
  survey.tile_format = cfg.tile_format().empty() ? "jpeg" : cfg.tile_format();
  survey.category    = cfg.category().empty() ? "other" : cfg.category();
  survey.description = cfg.description();
  if (survey.url.back() != '/') {
    survey.url.push_back('/');
  }
  return survey;
}

} // namespace

std::vector<HiPSSurvey> SurveyCatalog::BuiltinSurveys() {
  return {
      {"CDS/P/DSS2/color", "DSS2 colored", "https://alasky.cds.unistra.fr/DSS/DSSColor/", 9, "jpeg", "optical",
       "Digitized Sky Survey 2, color composite of the red and blue plates"},
      {"CDS/P/2MASS/color", "2MASS color J-H-K", "https://alasky.cds.unistra.fr/2MASS/Color/", 9, "jpeg png", "infrared",
       "Two Micron All Sky Survey, J/H/K color composite"},
      {"CDS/P/Mellinger/color", "Mellinger color optical survey", "https://alasky.cds.unistra.fr/MellingerRGB/", 4, "jpeg", "optical",
       "Axel Mellinger's all-sky Milky Way panorama"},
  };
}

SurveyCatalog::SurveyCatalog(std::vector<HiPSSurvey> surveys) : surveys_(std::move(surveys)) {
}

SurveyCatalog SurveyCatalog::FromConfig(const skycache::runtime::config::HipsConfig& cfg) {
  auto surveys = BuiltinSurveys();

  for (const auto& configured : cfg.surveys()) {
    auto survey = FromProto(configured);
    auto it     = std::find_if(surveys.begin(), surveys.end(), [&](const HiPSSurvey& s) { return s.id == survey.id; });
    if (it != surveys.end()) {
      *it = std::move(survey);
    } else {
      surveys.push_back(std::move(survey));
    }
  }
  return SurveyCatalog(std::move(surveys));
}

const HiPSSurvey* SurveyCatalog::Find(const std::string& id) const {
  auto it = std::find_if(surveys_.begin(), surveys_.end(), [&](const HiPSSurvey& s) { return s.id == id; });
  return it == surveys_.end() ? nullptr : &*it;
}

const HiPSSurvey& SurveyCatalog::Get(const std::string& id) const {
  const auto* survey = Find(id);
  if (!survey) {
    throw util::NotFound("unknown survey: " + id);
  }
  return *survey;
}

} // namespace skycache::hips

// Copyright (c) 2018-2024 TU Delft 3D geoinformation group, Ravi Peters (3DGI),
// and Balazs Dukai (3DGI)

// This file is part of canopy, which is based on roofer
// (https://github.com/3DBAG/roofer)

// canopy is free software: you can redistribute it and/or modify it under the
// terms of the GNU General Public License as published by the Free Software
// Foundation, either version 3 of the License, or (at your option) any later
// version. canopy is distributed in the hope that it will be useful, but
// WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
// FITNESS FOR A PARTICULAR PURPOSE. See the GNU General Public License for more
// details. You should have received a copy of the GNU General Public License
// along with canopy. If not, see <https://www.gnu.org/licenses/>.

#pragma once
#include <canopy/PlantingConfig.hpp>
#include <canopy/common/common.hpp>
#include <canopy/common/formatters.hpp>
#include <canopy/logger/logger.h>

#include <format>
#include <list>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <toml.hpp>

#include "validators.hpp"

// Formatter for canopy::logger::LogLevel
template <>
struct std::formatter<canopy::logger::LogLevel> {
  constexpr auto parse(std::format_parse_context& ctx) { return ctx.begin(); }

  auto format(const canopy::logger::LogLevel& level,
              std::format_context& ctx) const {
    return std::format_to(ctx.out(), "{}", canopy::logger::to_string(level));
  }
};

namespace canopy::detail {
  inline canopy::logger::LogLevel parse_loglevel(const std::string& s) {
    if (auto level = canopy::logger::level_from_string(s)) {
      return *level;
    }
    throw std::runtime_error("Invalid argument for LogLevel: " + s);
  }

  // parse "limit:points[,limit:points...]"
  inline canopy::ScoreBands parse_bands(const std::string& s) {
    canopy::ScoreBands bands;
    for (auto& pair : canopy::split_string(s, ",")) {
      auto lp = canopy::split_string(pair, ":");
      if (lp.size() != 2) {
        throw std::runtime_error("Invalid score band: " + pair +
                                 ", expected limit:points.");
      }
      bands.push_back({std::stof(lp[0]), std::stof(lp[1])});
    }
    return bands;
  }
}  // namespace canopy::detail

struct ConfigParameter {
  std::string help_;
  std::string longname_;
  std::optional<char> shortname_;
  ConfigParameter(std::string longname, char shortname, std::string help)
      : help_(help), longname_(longname), shortname_(shortname){};
  ConfigParameter(std::string longname, std::string help)
      : help_(help), longname_(longname){};
  virtual ~ConfigParameter() = default;

  virtual std::optional<std::string> validate() = 0;

  virtual std::list<std::string>::iterator set(
      std::list<std::string>& args, std::list<std::string>::iterator it) = 0;
  virtual void unset() = 0;

  virtual void set_from_toml(const toml::table& table,
                             const std::string& name) = 0;

  virtual std::string description() = 0;
  virtual std::string type_description() = 0;
  virtual std::string to_string() = 0;
  virtual std::string default_to_string() = 0;
  virtual std::string cli_flag() = 0;
};

template <typename T>
struct ConfigParameterByReference : public ConfigParameter {
  T& value_;
  T default_value_;
  std::vector<Validator<T>> _validators;

  ConfigParameterByReference(std::string longname, std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};
  ConfigParameterByReference(std::string longname, char shortname,
                             std::string help, T& value,
                             std::vector<Validator<T>> validators)
      : ConfigParameter(longname, shortname, help),
        value_(value),
        default_value_(value),
        _validators(validators){};

  std::optional<std::string> validate() override {
    for (auto& validator : _validators) {
      if (auto error_msg = validator(value_)) {
        return error_msg;
      }
    }
    return std::nullopt;
  }

  std::string to_string() override { return std::format("{}", value_); }

  std::string default_to_string() override {
    std::string s = std::format("{}", default_value_);
    if (s.size() == 0) {
      return "<no value>";
    } else {
      return s;
    }
  }

  std::string cli_flag() override {
    if (shortname_.has_value()) {
      return std::format("-{}, --{}", shortname_.value(), longname_);
    } else {
      if constexpr (std::is_same_v<T, bool>) {
        return std::format("--[no-]{}", longname_);
      } else {
        return std::format("--{}", longname_);
      }
    }
  }

  void unset() override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = false;
    } else {
      value_ = default_value_;
    }
  }

  std::list<std::string>::iterator set(
      std::list<std::string>& args,
      std::list<std::string>::iterator it) override {
    if constexpr (std::is_same_v<T, bool>) {
      value_ = true;
      return it;
    } else {
      if (it == args.end()) {
        throw std::runtime_error("Missing argument for parameter");
      } else if constexpr (std::is_same_v<T, int>) {
        value_ = std::stoi(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, float>) {
        value_ = std::stof(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, double> ||
                           std::is_same_v<T, std::optional<double>>) {
        value_ = std::stod(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, std::string>) {
        value_ = *it;
        return args.erase(it);
      } else if constexpr (std::is_same_v<
                               T, std::optional<canopy::TBox<double>>>) {
        canopy::TBox<double> box;
        // Check if there are enough arguments
        if (std::distance(it, args.end()) < 4) {
          throw std::runtime_error("Not enough arguments, need 4.");
        }

        box.pmin[0] = std::stod(*it);
        it = args.erase(it);
        box.pmin[1] = std::stod(*it);
        it = args.erase(it);
        box.pmax[0] = std::stod(*it);
        it = args.erase(it);
        box.pmax[1] = std::stod(*it);
        it = args.erase(it);
        box.just_cleared = false;
        value_ = box;
        return it;
      } else if constexpr (std::is_same_v<T, canopy::logger::LogLevel>) {
        value_ = canopy::detail::parse_loglevel(*it);
        return args.erase(it);
      } else if constexpr (std::is_same_v<T, canopy::ScoreBands>) {
        value_ = canopy::detail::parse_bands(*it);
        return args.erase(it);
      } else {
        static_assert(!std::is_same_v<T, T>,
                      "Unsupported type for ConfigParameterByReference::set()");
      }
    }
  }

  void set_from_toml(const toml::table& table,
                     const std::string& name) override {
    if constexpr (std::is_same_v<T, std::optional<canopy::TBox<double>>>) {
      if (const toml::array* a = table[name].as_array()) {
        if (a->size() == 4 &&
            (a->is_homogeneous(toml::node_type::floating_point) ||
             a->is_homogeneous(toml::node_type::integer))) {
          value_ = canopy::TBox<double>{
              *a->get(0)->value<double>(), *a->get(1)->value<double>(),
              *a->get(2)->value<double>(), *a->get(3)->value<double>()};
        } else {
          throw std::runtime_error("Failed to read value for " + name +
                                   " from config file.");
        }
      }
    } else if constexpr (std::is_same_v<T, std::optional<double>>) {
      if (auto value = table[name].value<double>(); value.has_value()) {
        value_ = *value;
      }
    } else if constexpr (std::is_same_v<T, canopy::logger::LogLevel>) {
      if (const toml::value<std::string>* s = table[name].as_string()) {
        value_ = canopy::detail::parse_loglevel(s->get());
      }
    } else if constexpr (std::is_same_v<T, canopy::ScoreBands>) {
      // array of [limit, points] pairs
      if (const toml::array* a = table[name].as_array()) {
        canopy::ScoreBands bands;
        for (const auto& el : *a) {
          const toml::array* pair = el.as_array();
          if (!pair || pair->size() != 2 || !pair->get(0)->is_number() ||
              !pair->get(1)->is_number()) {
            throw std::runtime_error("Failed to read value for " + name +
                                     " from config file. Expected a list of "
                                     "[limit, points] pairs.");
          }
          bands.push_back({*pair->get(0)->value<float>(),
                           *pair->get(1)->value<float>()});
        }
        value_ = bands;
      }
    } else {
      if (auto value = table[name].value<T>(); value.has_value()) {
        value_ = *value;
      }
    }
  }

  std::string description() override { return std::format("{}", help_); }

  std::string type_description() override {
    if constexpr (std::is_same_v<T, bool>) {
      return "";
    } else if constexpr (std::is_same_v<T, int>) {
      return "<int>";
    } else if constexpr (std::is_same_v<T, float>) {
      return "<float>";
    } else if constexpr (std::is_same_v<T, double> ||
                         std::is_same_v<T, std::optional<double>>) {
      return "<double>";
    } else if constexpr (std::is_same_v<T, std::string>) {
      return "<string>";
    } else if constexpr (std::is_same_v<T,
                                        std::optional<canopy::TBox<double>>>) {
      return "(xmin ymin xmax ymax)";
    } else if constexpr (std::is_same_v<T, canopy::logger::LogLevel>) {
      return "(trace|debug|info|warning|error|critical|off)";
    } else if constexpr (std::is_same_v<T, canopy::ScoreBands>) {
      return "limit:points[,...]";
    } else {
      static_assert(!std::is_same_v<T, T>,
                    "Unsupported type for "
                    "ConfigParameterByReference::type_description()");
    }
  }
};

class ParameterVector {
 public:
  std::vector<std::unique_ptr<ConfigParameter>> params_;

  ParameterVector(){};
  ~ParameterVector() = default;

  ParameterVector(ParameterVector&&) = default;
  ParameterVector& operator=(ParameterVector&&) = default;

  // parameters hold references into the config, copying makes no sense
  ParameterVector(const ParameterVector&) = delete;
  ParameterVector& operator=(const ParameterVector&) = delete;

  template <typename T>
  ConfigParameter& add(const std::string& longname, const std::string& help,
                       T& value, std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, help, value, std::move(validators)));
    return *params_.back();
  }

  template <typename T>
  ConfigParameter& add(const std::string& longname, const char shortname,
                       const std::string& help, T& value,
                       std::vector<Validator<T>> validators = {}) {
    params_.emplace_back(std::make_unique<ConfigParameterByReference<T>>(
        longname, shortname, help, value, std::move(validators)));
    return *params_.back();
  }

  void add_to_index(std::unordered_map<std::string, ConfigParameter*>& index) {
    for (auto& param : params_) {
      index[param->longname_] = param.get();
      if (param->shortname_.has_value()) {
        index[std::string(1, param->shortname_.value())] = param.get();
      }
    }
  }

  auto begin() { return params_.begin(); }
  auto end() { return params_.end(); }
  auto begin() const { return params_.begin(); }
  auto end() const { return params_.end(); }
  auto size() const { return params_.size(); }
  auto empty() const { return params_.empty(); }
  auto& operator[](size_t i) { return params_[i]; }
  auto& operator[](size_t i) const { return params_[i]; }
};

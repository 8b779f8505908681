#pragma once
#include "iactuator.hpp"
#include <algorithm>
#include <string>
#include <utility>

/**
 * @brief In-memory valve element standing in for the network solver
 *
 * Stores what the automation layer commands; the opening is limited to
 * the physical range [0, 100].
 */
struct SimValveElement : IValveElement {
  std::string id;
  double opening{0.0};
  double resistance_full_open{1.0};
  bool linear{true};
  double closed_factor{0.0};

  explicit SimValveElement(std::string name = "valve") : id(std::move(name)) {}

  void set(double v) override { opening = std::max(0.0, std::min(100.0, v)); }
  double get() const override { return opening; }

  void set_resistance_full_open(double r) override { resistance_full_open = r; }
  void set_characteristic(bool lin, double factor) override {
    linear = lin;
    closed_factor = factor;
  }
};

/**
 * @brief In-memory effort (pressure) source, e.g. a pump head
 */
struct SimEffortSource : IActuator {
  std::string id;
  double effort{0.0};

  explicit SimEffortSource(std::string name = "effort") : id(std::move(name)) {}

  void set(double v) override { effort = v; }
  double get() const override { return effort; }
};

/**
 * @brief In-memory flow source in kg/s
 */
struct SimFlowSource : IActuator {
  std::string id;
  double flow{0.0};

  explicit SimFlowSource(std::string name = "flow") : id(std::move(name)) {}

  void set(double v) override { flow = v; }
  double get() const override { return flow; }
};

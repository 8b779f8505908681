#pragma once

/**
 * @brief Physical model element driven by the automation layer
 *
 * Implemented by the fluid/heat network (valve openings, pump effort,
 * source flow). The automation layer only writes set-values each step.
 */
struct IActuator {
  virtual ~IActuator() = default;
  virtual void set(double) = 0;
  virtual double get() const = 0;
};

/**
 * @brief Valve element of the network model
 *
 * set() takes the opening in percent (0 = closed, 100 = open).
 */
struct IValveElement : IActuator {
  /**
   * @brief Flow resistance at 100 % opening in Pa/(kg/s)
   */
  virtual void set_resistance_full_open(double resistance) = 0;

  /**
   * @brief Select the opening characteristic
   * @param linear true for the linear characteristic
   * @param closed_factor resistance multiplier at closed position for the
   *        non-linear characteristic
   */
  virtual void set_characteristic(bool linear, double closed_factor) = 0;
};

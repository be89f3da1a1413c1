// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <pigpio.h>
#include <set>

class GPIOLibHandle {
private:
  struct CtorTag {};

public:
  using Ptr = std::shared_ptr<GPIOLibHandle>;
  using Ref = std::weak_ptr<GPIOLibHandle>;
  static Ptr instance();
  static Ref weak_instance();

  GPIOLibHandle(CtorTag const &) : GPIOLibHandle() {}

private:
  void terminate();
  static void atexit_cleanup();

  static Ref handle;
  static bool initialized;
  static bool terminated;

  GPIOLibHandle();
  ~GPIOLibHandle();
};

struct PiGPIO : public IGPIO {

  PiGPIO();

  static unsigned int translate_mode(Modes mode);
  static Modes translate_mode(int mode);
  static unsigned int translate_pull(Pull pull);
  // pigpio only takes whole hertz
  static unsigned int translate_frequency(double frequency);
  static void ensure_running();

  void set_gpio_mode(port_id_t port, Modes mode, val_t initial) override;
  using IGPIO::set_gpio_mode;
  Modes gpio_mode(port_id_t port) override;
  void set_pull(port_id_t port, Pull pull) override;

  void gpio_write(port_id_t gpio, val_t val) override;
  val_t gpio_read(port_id_t gpio) override;

  void pwm_start(port_id_t port, double frequency, double duty_cycle) override;
  void pwm_set_frequency(port_id_t port, double frequency) override;
  void pwm_set_duty_cycle(port_id_t port, double duty_cycle) override;
  void pwm_stop(port_id_t port) override;

  void add_event_detect(port_id_t port, Edge edge,
                        EventCallback callback) override;
  void remove_event_detect(port_id_t port) override;

  void release(port_id_t port) override;
  void cleanup() override;
  void set_warnings(bool enabled) override;

private:
  struct Alert {
    Edge edge;
    EventCallback callback;
  };

  static void on_alert(int gpio, int level, uint32_t tick, void *userdata);
  void dispatch(port_id_t port, val_t level, uint32_t tick);
  void ensure_initialized() const;
  void claim(port_id_t port);

  std::recursive_mutex m_mutex;
  std::map<port_id_t, Alert> m_alerts;
  std::set<port_id_t> m_pwm;
  std::set<port_id_t> m_claimed;
  // gpioTick() wraps around every ~72 minutes
  uint32_t m_last_tick = 0;
  uint64_t m_tick_epoch = 0;
  bool m_warnings = true;
  GPIOLibHandle::Ptr m_handle;
};

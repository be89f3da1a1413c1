// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos <attila.gombos@effective-range.com>
// SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
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

  // number of library initialisations since process start
  static unsigned init_count() noexcept { return init_cnt; }

private:
  void terminate();
  static void atexit_cleanup();

  static Ref handle;
  static bool initialized;
  static bool terminated;
  static unsigned init_cnt;

  GPIOLibHandle();
  ~GPIOLibHandle();
};

// In-memory GPIO lines. Inputs float low unless pulled up or driven from the
// test through drive(). Edge callbacks run synchronously inside drive().
struct MockGPIO : public IGPIO {
  struct PWMState {
    double frequency;
    double duty_cycle;
  };
  struct GPIOState {
    const port_id_t id;
    Modes mode = Modes::UNDEFINED;
    Pull pull = Pull::OFF;
    // latched output level
    std::optional<val_t> val;
    // level applied from outside on an input
    std::optional<val_t> driven;
    std::optional<PWMState> pwm;
    std::optional<Edge> edge;
    EventCallback callback;
  };

  MockGPIO();

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

  static std::shared_ptr<MockGPIO> Create();

  // Simulated hardware
  void drive(port_id_t port, val_t level, std::chrono::nanoseconds timestamp);
  void drive(port_id_t port, val_t level);
  // Claimed by a live consumer, every request fails
  void set_busy(port_id_t port, bool busy = true);
  // Left configured by a dead process, claiming fails while warnings are on
  void set_stale(port_id_t port, bool stale = true);
  void set_fail_event_detect(bool fail) { m_fail_event_detect = fail; }
  // Bias not supported by the line driver
  void set_fail_pull(bool fail) { m_fail_pull = fail; }

  std::optional<GPIOState> get_state(port_id_t);
  unsigned event_registrations(port_id_t port) const;
  unsigned releases(port_id_t port) const;
  [[nodiscard]] bool warnings() const noexcept { return m_warnings; }
  [[nodiscard]] bool released() const noexcept { return !m_handle; }

private:
  GPIOState &line(port_id_t port);
  GPIOState &claimed_line(port_id_t port);
  void ensure_initialized() const;
  static val_t level(GPIOState const &state);

  using GPIOStates = std::map<port_id_t, GPIOState>;
  mutable std::recursive_mutex m_mutex;
  GPIOStates m_gpios;
  std::set<port_id_t> m_busy;
  std::set<port_id_t> m_stale;
  std::map<port_id_t, unsigned> m_registrations;
  std::map<port_id_t, unsigned> m_releases;
  bool m_fail_event_detect = false;
  bool m_fail_pull = false;
  bool m_warnings = true;
  GPIOLibHandle::Ptr m_handle;
};

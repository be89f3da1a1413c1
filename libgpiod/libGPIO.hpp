// SPDX-FileCopyrightText: 2024 Ferenc Nandor Janky <ferenj@effective-range.com>
// SPDX-FileCopyrightText: 2024 Attila Gombos
// <attila.gombos@effective-range.com> SPDX-License-Identifier: MIT

#pragma once

#include <IGPIO.hpp>

#include <atomic>
#include <gpiod.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <thread>

// libgpiod reports edges on inputs only and has no PWM: both run on a worker
// thread per line.
struct LibGPIO : public IGPIO {

  LibGPIO(std::string_view device = "gpiochip0");
  ~LibGPIO() override;

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
  // Thread running until stopped, stopping from its own thread detaches it
  class Worker {
  public:
    using StopFlag = std::shared_ptr<std::atomic<bool>>;

    template <typename F>
    explicit Worker(F body)
        : m_stop{std::make_shared<std::atomic<bool>>(false)},
          m_thread{[stop = m_stop, body = std::move(body)]() mutable {
            body(stop);
          }} {}
    Worker(const Worker &) = delete;
    Worker &operator=(const Worker &) = delete;
    ~Worker() { stop(); }

    void stop();

  private:
    StopFlag m_stop;
    std::thread m_thread;
  };

  struct PWMSettings {
    std::atomic<double> frequency;
    std::atomic<double> duty_cycle;
  };

  struct LineState {
    gpiod::line line;
    Modes mode = Modes::UNDEFINED;
    Pull pull = Pull::OFF;
    std::optional<Edge> edge;
    EventCallback callback;
    std::unique_ptr<Worker> watcher;
    std::unique_ptr<Worker> pwm;
    std::shared_ptr<PWMSettings> pwm_settings;
  };

  LineState &get_line(port_id_t gpio);
  LineState &claimed_line(port_id_t gpio);
  void request(port_id_t port, LineState &state, int request_type,
               val_t initial = 0);
  void start_watcher(port_id_t port, LineState &state);
  void ensure_initialized() const;

  std::recursive_mutex m_mutex;
  gpiod::chip m_handle;
  std::map<port_id_t, LineState> m_lines;
  bool m_warnings = true;
};

#include "modbus_manager.hpp"
#include <cerrno>
#include <thread>

ModbusManagerStats::ModbusManagerStats() : read_success(0), read_errors(0) {}

ModbusManagerStats::ModbusManagerStats(int rs, int re)
    : read_success(rs), read_errors(re) {}

ModbusManager::ModbusManager(const ModbusConfig &config)
    : config_(config), ctx_(nullptr), connected_(false),
      logger_("ModbusManager"), read_success_(0), read_errors_(0),
      last_error_log_(std::chrono::steady_clock::now() -
                      std::chrono::seconds(11)) {}

ModbusManager::~ModbusManager() { disconnect(); }

bool ModbusManager::connect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (connected_) {
    return true;
  }

  ctx_ = modbus_new_rtu(config_.port.c_str(), config_.baudrate, config_.parity,
                        config_.data_bits, config_.stop_bits);

  if (ctx_ == nullptr) {
    logger_.critical() << "Failed to create Modbus RTU context for "
                       << config_.port;
    return false;
  }

  if (modbus_connect(ctx_) == -1) {
    logger_.critical() << "Button board connection failed on " << config_.port
                       << ": " << modbus_strerror(errno);
    modbus_free(ctx_);
    ctx_ = nullptr;
    return false;
  }

  modbus_set_response_timeout(ctx_, 0, config_.response_timeout_ms * 1000);
  modbus_set_byte_timeout(ctx_, 0, config_.byte_timeout_ms * 1000);

  connected_ = true;

  logger_.info() << "Button board connected: " << config_.port << " @ "
                 << config_.baudrate << " baud, timeouts "
                 << config_.response_timeout_ms << "ms response, "
                 << config_.byte_timeout_ms << "ms byte";

  return true;
}

void ModbusManager::disconnect() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (ctx_) {
    modbus_close(ctx_);
    modbus_free(ctx_);
    ctx_ = nullptr;
    logger_.info() << "Button board disconnected";
  }

  connected_ = false;
}

bool ModbusManager::is_connected() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connected_;
}

bool ModbusManager::read_discrete_inputs(int slave_id, int start_addr,
                                         std::array<uint8_t, 8> &dest) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!connected_ || !ctx_) {
    return false;
  }

  for (int retry = 0; retry < config_.max_retries; retry++) {
    if (modbus_set_slave(ctx_, slave_id) == -1) {
      logger_.error() << "Invalid Modbus slave id " << slave_id;
      read_errors_++;
      return false;
    }

    int rc = modbus_read_input_bits(ctx_, start_addr, dest.size(), dest.data());
    if (rc != -1) {
      read_success_++;
      return true;
    }

    if (retry < config_.max_retries - 1) {
      std::this_thread::sleep_for(std::chrono::milliseconds(30));
    }
  }

  read_errors_++;

  // Board reads run every few milliseconds, log at most every 10s
  auto now = std::chrono::steady_clock::now();
  if (now - last_error_log_ > std::chrono::seconds(10)) {
    logger_.error() << "Button board read error: slave " << slave_id
                    << " addr " << start_addr << " (after "
                    << config_.max_retries
                    << " retries): " << modbus_strerror(errno);
    last_error_log_ = now;
  }

  return false;
}

std::unique_ptr<ModbusManagerStats> ModbusManager::get_stats() const {
  return std::make_unique<ModbusManagerStats>(read_success_.load(),
                                              read_errors_.load());
}

void ModbusManager::reset_stats() {
  read_success_ = 0;
  read_errors_ = 0;
}

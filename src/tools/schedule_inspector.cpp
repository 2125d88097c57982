#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <vestry/common/critical.hpp>
#include <vestry/schema/escrow_state.hpp>
#include <vestry/schema/primitives.hpp>
#include <vestry/vesting/schedule.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace {

namespace po = boost::program_options;

void install_logger(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "vestry_schedule.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "vestry_schedule", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

vestry::schema::amount_t get_amount(const po::variables_map& vm,
                                    const std::string& name) {
  if (!vm.contains(name)) {
    vestry::common::critical("missing required --{} argument", name);
  }
  auto amount = vestry::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    vestry::common::critical("--{} must be an unsigned decimal integer", name);
  }
  return *amount;
}

std::optional<uint64_t> get_optional_seconds(const po::variables_map& vm,
                                             const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return vm[name].as<uint64_t>();
}

void print_help(const po::options_description& options) {
  std::cout << "vestry_schedule: evaluate one vesting schedule at an instant\n"
            << "usage: vestry_schedule --total N --start T --end T [options]\n"
            << options << std::endl;
}

}  // namespace

int main(int argc, const char** argv) {
  auto options = po::options_description{"vestry_schedule options"};
  options.add_options()("help,h", "show help")(
      "total", po::value<std::string>(), "total vesting amount (decimal)")(
      "start", po::value<uint64_t>(), "start time, unix seconds")(
      "end", po::value<uint64_t>(), "end time, unix seconds")(
      "cliff", po::value<uint64_t>()->default_value(0),
      "cliff duration, seconds")("now", po::value<uint64_t>(),
                                 "valuation instant; defaults to --start")(
      "claimed", po::value<std::string>()->default_value("0"),
      "amount already claimed (decimal)")(
      "paused-at", po::value<uint64_t>(),
      "value the schedule as paused at this instant")(
      "escrow-terminated-at", po::value<uint64_t>(),
      "value the schedule under an escrow terminated at this instant")(
      "verbose,v", "enable debug logging");

  auto vm = po::variables_map{};
  po::store(po::parse_command_line(argc, argv, options), vm);
  po::notify(vm);

  if (vm.contains("help") || !vm.contains("total") || !vm.contains("start") ||
      !vm.contains("end")) {
    print_help(options);
    return 0;
  }

  install_logger(vm.contains("verbose"));

  auto terms = vestry::vesting::schedule_terms{
      .total_vesting_amount = get_amount(vm, "total"),
      .start_time = vm["start"].as<uint64_t>(),
      .end_time = vm["end"].as<uint64_t>(),
      .cliff_duration = vm["cliff"].as<uint64_t>()};
  auto now = get_optional_seconds(vm, "now").value_or(terms.start_time);

  if (auto reason = vestry::vesting::validate_terms(terms, now, true)) {
    spdlog::error("Schedule rejected: {}", *reason);
    spdlog::shutdown();
    return 1;
  }

  auto recipient = vestry::vesting::make_recipient_state(
      vestry::schema::make_hash32(std::string(64, '1')), terms);
  recipient.total_claimed = get_amount(vm, "claimed");
  if (recipient.total_claimed > recipient.total_vesting_amount) {
    spdlog::error("Claimed {} exceeds total {}", recipient.total_claimed.str(),
                  recipient.total_vesting_amount.str());
    spdlog::shutdown();
    return 1;
  }
  if (auto paused_at = get_optional_seconds(vm, "paused-at")) {
    recipient.status = vestry::schema::recipient_status_t::paused;
    recipient.last_paused_at = *paused_at;
  }

  auto lifecycle = vestry::schema::escrow_lifecycle_t{
      vestry::schema::escrow_active_t{}};
  if (auto terminated_at = get_optional_seconds(vm, "escrow-terminated-at")) {
    lifecycle = vestry::schema::escrow_terminated_t{.terminated_at =
                                                        *terminated_at};
  }

  spdlog::debug("Rate {} per second over {}s, remainder {}",
                recipient.vesting_per_second.str(),
                vestry::vesting::vesting_duration(recipient),
                vestry::vesting::truncation_remainder(recipient).str());

  try {
    auto locked = vestry::vesting::locked_amount(recipient, now, lifecycle);
    auto vested = vestry::vesting::vested_amount(recipient, now, lifecycle);
    auto claimable =
        vestry::vesting::claimable_amount(recipient, now, lifecycle);
    std::cout << "vesting_per_second " << recipient.vesting_per_second.str()
              << "\nclaim_start_time "
              << vestry::vesting::claim_start_time(recipient)
              << "\nvaluation_instant "
              << vestry::vesting::valuation_instant(recipient, now, lifecycle)
                     .value_or(now)
              << "\nlocked " << locked.value_or(0).str() << "\nvested "
              << vested.value_or(0).str() << "\nclaimable "
              << claimable.value_or(0).str() << "\ncan_claim "
              << (vestry::vesting::can_claim(recipient, now) ? "true"
                                                              : "false")
              << std::endl;
  } catch (const std::range_error& ex) {
    spdlog::error("Valuation failed: {}", ex.what());
    spdlog::shutdown();
    return 1;
  } catch (const std::overflow_error& ex) {
    spdlog::error("Valuation failed: {}", ex.what());
    spdlog::shutdown();
    return 1;
  }

  spdlog::shutdown();
  return 0;
}

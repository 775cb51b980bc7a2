#include "detection_config.hpp"
#include "launch_filter.hpp"
#include "launch_pipeline.hpp"
#include "risk_evaluator.hpp"
#include "solana_rpc_client.hpp"
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

namespace py = pybind11;
using namespace pybind11::literals;

namespace {

py::dict authorityDict(const AuthorityField &field) {
  py::object holder = py::none();
  if (field.holder) {
    holder = py::cast(*field.holder);
  }
  return py::dict("decoded"_a = field.decoded, "revoked"_a = field.revoked,
                  "holder"_a = holder);
}

} // namespace

py::dict
check_launch_sync(const std::string &signature,
                  const std::vector<std::string> &log_lines,
                  const std::string &rpc_url, int timeout_ms) {
  try {
    LaunchOutcome outcome;
    {
      // Network round trips do not need the GIL
      py::gil_scoped_release release;
      SolanaRpcClient rpc(rpc_url, std::chrono::milliseconds(timeout_ms));
      LaunchPipeline pipeline(rpc);
      outcome = pipeline.process(LaunchEvent{signature, log_lines});
    }

    if (!outcome.ok()) {
      return py::dict("ok"_a = false, "high_risk"_a = py::none(),
                      "mint"_a = py::none(), "creator"_a = py::none(),
                      "good_signs"_a = py::list(), "red_flags"_a = py::list(),
                      "error"_a = py::dict("kind"_a = toString(outcome.error),
                                           "message"_a = outcome.detail));
    }

    const auto &verdict = *outcome.verdict;
    return py::dict("ok"_a = true, "high_risk"_a = verdict.high_risk,
                    "mint"_a = verdict.mint, "creator"_a = verdict.creator,
                    "good_signs"_a = verdict.good_signs,
                    "red_flags"_a = verdict.red_flags, "error"_a = py::none());
  } catch (const std::exception &e) {
    return py::dict("ok"_a = false, "high_risk"_a = py::none(),
                    "mint"_a = py::none(), "creator"_a = py::none(),
                    "good_signs"_a = py::list(), "red_flags"_a = py::list(),
                    "error"_a = py::dict("kind"_a = "unexpected",
                                         "message"_a = e.what()));
  }
}

py::dict decode_mint_authorities(const py::bytes &data) {
  std::string raw = data;
  auto state = decodeMintAuthorities(std::span<const uint8_t>(
      reinterpret_cast<const uint8_t *>(raw.data()), raw.size()));
  return py::dict("mint_authority"_a = authorityDict(state.mint_authority),
                  "freeze_authority"_a = authorityDict(state.freeze_authority));
}

PYBIND11_MODULE(pump_rug_detector, m) {
  m.doc() = "Pump.fun launch rug pull detector";

  m.def("check_launch_sync", &check_launch_sync,
        "Resolve a launch transaction and evaluate its rug pull indicators",
        py::arg("signature"), py::arg("log_lines") = std::vector<std::string>{},
        py::arg("rpc_url") = std::string(DetectionConfig::default_rpc_url),
        py::arg("timeout_ms") = 5000);

  m.def("is_launch_event", &isLaunchEvent,
        "True if any log line mentions a token creation", py::arg("log_lines"));

  m.def("has_liquidity_burn", &hasLiquidityBurn,
        "True if any log line reports a Raydium LP burn", py::arg("log_lines"));

  m.def("decode_mint_authorities", &decode_mint_authorities,
        "Decode mint and freeze authorities from raw mint account bytes",
        py::arg("data"));

  py::class_<DetectionConfig>(m, "DetectionConfig")
      .def(py::init<>())
      .def_property_readonly_static(
          "pump_fun_program",
          [](py::object) { return std::string(DetectionConfig::pump_fun_program); })
      .def_property_readonly_static(
          "raydium_amm_program",
          [](py::object) { return std::string(DetectionConfig::raydium_amm_program); })
      .def_property_readonly_static(
          "token_program",
          [](py::object) { return std::string(DetectionConfig::token_program); })
      .def_property_readonly_static(
          "initial_supply_amount",
          [](py::object) { return std::string(DetectionConfig::initial_supply_amount); })
      .def_readonly_static("mint_authority_offset",
                           &DetectionConfig::mint_authority_offset)
      .def_readonly_static("freeze_authority_offset",
                           &DetectionConfig::freeze_authority_offset)
      .def_readonly_static("pubkey_size", &DetectionConfig::pubkey_size);
}

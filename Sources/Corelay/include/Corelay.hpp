#pragma once

// Corelay - Composable, cached processing pipelines
//
// Usage:
//   #include <Corelay.hpp>
//
//   class scale : public corelay::stage {
//       CORELAY_FIELDS(scale, corelay::stage,
//           {"factor", corelay::make_param(corelay::kind::real, 2.0, {.identifier = true})})
//   public:
//       corelay::value operation(const corelay::value& input) override {
//           return input.as_real() * get_as<double>("factor");
//       }
//   };
//
//   class analysis : public corelay::pipeline {
//       CORELAY_FIELDS(analysis, corelay::pipeline,
//           {"prepare", corelay::make_task()},
//           {"scale", corelay::make_task<scale>(corelay::make<scale>())})
//   };
//
//   int main() {
//       auto run = corelay::make<analysis>();
//       corelay::value result = (*run)(corelay::value(3.0));   // 6.0
//   }

#include "corelay/errors.hpp"
#include "corelay/log.hpp"
#include "corelay/types.hpp"
#include "corelay/field.hpp"
#include "corelay/registry.hpp"
#include "corelay/field_container.hpp"
#include "corelay/stage.hpp"
#include "corelay/pipeline.hpp"
#include "corelay/flow.hpp"
#include "corelay/hashing.hpp"
#include "corelay/codec.hpp"
#include "corelay/storage.hpp"
#include "corelay/db.hpp"

#include "../common/assertions.hpp"
#include "../common/lab_fixture.hpp"
#include "../common/temp_dir.hpp"
#include "grid/checkpoint_store.hpp"
#include "ranops/cli/router.hpp"

#include <iostream>
#include <string>

// One healthy cell end to end: every phase passes on the first attempt, the
// host is clean afterwards and the state file ends at "finished".
int main() {
  using namespace ranops::tests::common;

  ScopedTempDir temp("ranops-grid-success");
  LabFixture lab(temp.path());
  lab.WriteGrid();

  ranops::cli::RunOptions options;
  const ranops::cli::RunDependencies deps{lab.host, lab.control_plane, lab.core, lab.logger,
                                          lab.guard_options};
  ranops::grid::GridSummary summary;
  const int exit_code = ranops::cli::ExecuteGrid(options, lab.config, deps, &summary);
  const std::string log = lab.Log();

  ExpectEqual(exit_code, 0, "exit code");
  ExpectEqual(summary.cells.size(), std::size_t{1}, "cells run");
  ExpectEqual(summary.succeeded, std::size_t{1}, "succeeded cells");
  ExpectEqual(summary.cells[0].attempts, 1U, "attempts");
  Expect(lab.HostIsClean(), "host not clean after a successful run");
  ExpectEqual(lab.ArtifactsWritten(), 1U, "metrics artifacts written");

  ranops::grid::RunCheckpoint saved;
  std::string error;
  Expect(ranops::grid::LoadCheckpoint(lab.config.state_file, saved, error), error);
  ExpectEqual(saved.step, std::string("finished"), "final step");
  ExpectEqual(saved.completed_runs, std::uint64_t{1}, "completed runs");
  ExpectEqual(saved.last_completed, std::string("tr0/exp1"), "last completed cell");

  AssertContains(log, "trial=\"tr0/exp1\" msg=\"phase completed\" phase=\"Validated\"");
  AssertContains(log, "msg=\"metrics artifact valid\" rows=\"6\" span_s=\"5");
  AssertContains(log, "msg=\"cleanup started\" reason=\"cell finished\"");
  AssertContains(log, "msg=\"running exit cleanup\" route=\"completed\"");
  AssertContains(log, "msg=\"grid finished\" cells_run=\"1\" succeeded=\"1\"");
  AssertNotContains(log, "level=ERROR");

  std::cout << "grid_success_smoke: ok\n";
  return 0;
}

// file      : sqlgen/orchestrator.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_ORCHESTRATOR_HXX
#define SQLGEN_ORCHESTRATOR_HXX

#include <sqlgen/logger.hxx>
#include <sqlgen/options.hxx>
#include <sqlgen/ingestor.hxx>
#include <sqlgen/generator.hxx>
#include <sqlgen/diagnostics.hxx>

// Runs the compilation phases in order: type mapping rule compilation,
// ingestion, refinement, transformation, and generation. A phase is
// only started if the previous phases did not record any errors.
//
class orchestrator
{
public:
  orchestrator (options const&, logger&);

  // Return true if no errors were recorded in which case the output
  // contains every generated artifact. Otherwise the output contains
  // the artifacts that were generated before the failure, if any.
  // Warnings are recorded in both cases.
  //
  bool
  run (sources const&, artifacts& output, diagnostics&) const;

private:
  orchestrator (orchestrator const&);
  orchestrator& operator= (orchestrator const&);

private:
  options const& ops_;
  logger& log_;
};

#endif // SQLGEN_ORCHESTRATOR_HXX

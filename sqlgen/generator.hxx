// file      : sqlgen/generator.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_GENERATOR_HXX
#define SQLGEN_GENERATOR_HXX

#include <map>
#include <string>
#include <vector>
#include <utility> // std::pair

#include <sqlgen/options.hxx>
#include <sqlgen/diagnostics.hxx>
#include <sqlgen/target-model.hxx>

// Generated file name to content.
//
typedef std::map<std::string, std::string> artifacts;

class generator
{
public:
  generator (options const&);

  // Generate the artifacts for every entity, in parallel if more than
  // one job is configured. An artifact whose name is already taken by
  // another entity's artifact is reported as a collision and dropped.
  // The remaining artifacts are still returned.
  //
  artifacts
  generate (target::model const&, diagnostics&) const;

  // Artifacts of a single entity in the generation order: the header
  // for row entities; the header, data, and serialization files for
  // value sets.
  //
  typedef std::vector<std::pair<std::string, std::string> > entity_artifacts;

  entity_artifacts
  generate (target::entity const&) const;

private:
  generator (generator const&);
  generator& operator= (generator const&);

private:
  options const& ops_;
};

#endif // SQLGEN_GENERATOR_HXX

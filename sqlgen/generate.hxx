// file      : sqlgen/generate.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_GENERATE_HXX
#define SQLGEN_GENERATE_HXX

#include <sqlgen/target-model.hxx>

// Each function writes one artifact to the current context's stream.
//
namespace row
{
  void
  generate_header (target::entity const&);
}

namespace values
{
  // Value class, named constants, and inline accessors.
  //
  void
  generate_header (target::entity const&);

  // Parallel data arrays, constant definitions, and the value index.
  //
  void
  generate_data (target::entity const&);

  // String conversion and stream operators.
  //
  void
  generate_serialization (target::entity const&);
}

#endif // SQLGEN_GENERATE_HXX

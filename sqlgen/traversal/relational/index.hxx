// file      : sqlgen/traversal/relational/index.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX

#include <sqlgen/semantics/relational/index.hxx>
#include <sqlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct index: key_template<semantics::relational::index> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_INDEX_HXX

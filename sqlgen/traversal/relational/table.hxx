// file      : sqlgen/traversal/relational/table.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX

#include <sqlgen/semantics/relational/table.hxx>
#include <sqlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct table: scope_template<semantics::relational::table> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_TABLE_HXX

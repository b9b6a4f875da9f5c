// file      : sqlgen/traversal/relational/column.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX

#include <sqlgen/semantics/relational/column.hxx>
#include <sqlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct column: node<semantics::relational::column> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_COLUMN_HXX

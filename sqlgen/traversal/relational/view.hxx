// file      : sqlgen/traversal/relational/view.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_VIEW_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_VIEW_HXX

#include <sqlgen/semantics/relational/view.hxx>
#include <sqlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct view: scope_template<semantics::relational::view> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_VIEW_HXX

// file      : sqlgen/traversal/relational/model.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX

#include <sqlgen/semantics/relational/model.hxx>
#include <sqlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    struct model: scope_template<semantics::relational::model> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_MODEL_HXX

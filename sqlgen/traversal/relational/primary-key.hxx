// file      : sqlgen/traversal/relational/primary-key.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX

#include <sqlgen/semantics/relational/primary-key.hxx>
#include <sqlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct primary_key: key_template<semantics::relational::primary_key> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_PRIMARY_KEY_HXX

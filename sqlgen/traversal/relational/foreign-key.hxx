// file      : sqlgen/traversal/relational/foreign-key.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX
#define SQLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX

#include <sqlgen/semantics/relational/foreign-key.hxx>
#include <sqlgen/traversal/relational/key.hxx>

namespace traversal
{
  namespace relational
  {
    struct foreign_key: key_template<semantics::relational::foreign_key> {};
  }
}

#endif // SQLGEN_TRAVERSAL_RELATIONAL_FOREIGN_KEY_HXX

// file      : sqlgen/traversal/relational/elements.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <sqlgen/traversal/relational/elements.hxx>

namespace traversal
{
  namespace relational
  {
    void names::
    traverse (type& e)
    {
      dispatch (e.nameable ());
    }
  }
}

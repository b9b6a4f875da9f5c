// file      : sqlgen/semantics/relational/view.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <sqlgen/semantics/relational/view.hxx>

namespace semantics
{
  namespace relational
  {
    // type info
    //
    namespace
    {
      struct init
      {
        init ()
        {
          using compiler::type_info;

          // view
          //
          {
            type_info ti (typeid (view));
            ti.add_base (typeid (nameable));
            ti.add_base (typeid (scope));
            insert (ti);
          }
        }
      } init_;
    }
  }
}

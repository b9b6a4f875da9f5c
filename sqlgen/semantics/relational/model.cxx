// file      : sqlgen/semantics/relational/model.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <sqlgen/semantics/relational/model.hxx>

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

          // model
          //
          {
            type_info ti (typeid (model));
            ti.add_base (typeid (scope));
            insert (ti);
          }
        }
      } init_;
    }
  }
}

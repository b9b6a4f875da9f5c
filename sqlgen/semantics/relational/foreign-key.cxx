// file      : sqlgen/semantics/relational/foreign-key.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <ostream>

#include <cutl/compiler/type-info.hxx>

#include <sqlgen/semantics/relational/foreign-key.hxx>

using namespace std;

namespace semantics
{
  namespace relational
  {
    static const char* action_str[] = {
      "NO ACTION", "CASCADE", "SET NULL", "SET DEFAULT"};

    ostream&
    operator<< (ostream& os, foreign_key::action_type v)
    {
      return os << action_str[v];
    }

    // type info
    //
    namespace
    {
      struct init
      {
        init ()
        {
          using compiler::type_info;

          // references
          //
          {
            type_info ti (typeid (references));
            ti.add_base (typeid (edge));
            insert (ti);
          }

          // foreign_key
          //
          {
            type_info ti (typeid (foreign_key));
            ti.add_base (typeid (key));
            insert (ti);
          }
        }
      } init_;
    }
  }
}

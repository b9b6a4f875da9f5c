// file      : sqlgen/semantics/relational/table.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <sqlgen/semantics/relational/table.hxx>
#include <sqlgen/semantics/relational/primary-key.hxx>

namespace semantics
{
  namespace relational
  {
    primary_key* table::
    primary () const
    {
      for (names_const_iterator i (names_begin ()); i != names_end (); ++i)
      {
        if (primary_key* pk = dynamic_cast<primary_key*> (&i->nameable ()))
          return pk;
      }

      return 0;
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

          // table
          //
          {
            type_info ti (typeid (table));
            ti.add_base (typeid (nameable));
            ti.add_base (typeid (scope));
            insert (ti);
          }
        }
      } init_;
    }
  }
}

// file      : sqlgen/semantics/relational/elements.cxx
// license   : GNU GPL v3; see accompanying LICENSE file

#include <cutl/compiler/type-info.hxx>

#include <sqlgen/semantics/relational/elements.hxx>
#include <sqlgen/semantics/relational/column.hxx>
#include <sqlgen/semantics/relational/primary-key.hxx>

namespace semantics
{
  namespace relational
  {
    // scope
    //
    scope::names_iterator scope::
    find (string const& name)
    {
      names_map::iterator i (names_map_.find (ukey (name)));

      if (i == names_map_.end ())
        return names_.end ();
      else
        return i->second;
    }

    scope::names_const_iterator scope::
    find (string const& name) const
    {
      names_map::const_iterator i (names_map_.find (ukey (name)));

      if (i == names_map_.end ())
        return names_.end ();
      else
        return names_list::const_iterator (i->second);
    }

    void scope::
    add_edge_left (names& e)
    {
      nameable& n (e.nameable ());
      string k (ukey (e.name ()));

      names_map::iterator i (names_map_.find (k));

      if (i == names_map_.end ())
      {
        names_list::iterator i;

        // We want the order to be columns first, then the primary key,
        // and then the other keys.
        //
        if (n.is_a<column> ())
          i = names_.insert (first_key_, &e);
        else
        {
          if (n.is_a<primary_key> ())
            first_key_ = i = names_.insert (first_key_, &e);
          else
          {
            i = names_.insert (names_.end (), &e);

            if (first_key_ == names_.end ())
              first_key_ = i;
          }
        }

        names_map_[k] = i;
      }
      else
        throw duplicate_name (*this, (*i->second)->nameable (), n);
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

          // node
          //
          insert (type_info (typeid (node)));

          // edge
          //
          insert (type_info (typeid (edge)));

          // names
          //
          {
            type_info ti (typeid (names));
            ti.add_base (typeid (edge));
            insert (ti);
          }

          // nameable
          //
          {
            type_info ti (typeid (nameable));
            ti.add_base (typeid (node));
            insert (ti);
          }

          // scope
          //
          {
            type_info ti (typeid (scope));
            ti.add_base (typeid (node));
            insert (ti);
          }
        }
      } init_;
    }
  }
}

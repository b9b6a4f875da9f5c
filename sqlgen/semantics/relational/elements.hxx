// file      : sqlgen/semantics/relational/elements.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX

#include <map>
#include <list>
#include <vector>
#include <string>
#include <cassert>

#include <cutl/container/graph.hxx>
#include <cutl/container/pointer-iterator.hxx>
#include <cutl/compiler/context.hxx>

#include <sqlgen/diagnostics.hxx>
#include <sqlgen/semantics/relational/name.hxx>

namespace semantics
{
  namespace relational
  {
    using namespace cutl;

    using std::string;

    using container::graph;
    using container::pointer_iterator;

    using compiler::context;

    //
    //
    class node;
    class edge;

    //
    //
    class edge: public context
    {
    public:
      virtual
      ~edge () {}

    public:
      template <typename X>
      bool
      is_a () const
      {
        return dynamic_cast<X const*> (this) != 0;
      }
    };

    //
    //
    class node: public context
    {
    public:
      virtual
      ~node () {}

      // Return name of the node.
      //
      virtual string
      kind () const = 0;

    public:
      template <typename X>
      bool
      is_a () const
      {
        return dynamic_cast<X const*> (this) != 0;
      }

      // Sink functions that allow extensions in the form of one-way
      // edges.
      //
    public:
      void
      add_edge_right (edge&)
      {
      }
    };

    //
    //
    class scope;
    class nameable;

    //
    //
    class names: public edge
    {
    public:
      typedef relational::scope scope_type;
      typedef relational::nameable nameable_type;

      string const&
      name () const
      {
        return name_;
      }

      scope_type&
      scope () const
      {
        return *scope_;
      }

      nameable_type&
      nameable () const
      {
        return *nameable_;
      }

    public:
      names (string const& name): name_ (name) {}

      void
      set_left_node (scope_type& n)
      {
        scope_ = &n;
      }

      void
      set_right_node (nameable_type& n)
      {
        nameable_ = &n;
      }

    protected:
      string name_;
      scope_type* scope_;
      nameable_type* nameable_;
    };

    //
    //
    class nameable: public virtual node
    {
    public:
      typedef relational::scope scope_type;

      string const&
      name () const
      {
        return named_->name ();
      }

      scope_type&
      scope () const
      {
        return named ().scope ();
      }

      names&
      named () const
      {
        return *named_;
      }

      // Location of the declaration.
      //
      location const&
      loc () const
      {
        return loc_;
      }

    public:
      nameable (location const& l): loc_ (l), named_ (0) {}

      void
      add_edge_right (names& e)
      {
        assert (named_ == 0);
        named_ = &e;
      }

      using node::add_edge_right;

    private:
      location loc_;
      names* named_;
    };

    //
    //
    struct duplicate_name
    {
      typedef relational::scope scope_type;
      typedef relational::nameable nameable_type;

      duplicate_name (scope_type& s, nameable_type& o, nameable_type& d)
          : scope (s), orig (o), dup (d), name (o.name ())
      {
      }

      scope_type& scope;
      nameable_type& orig;
      nameable_type& dup;

      string name;
    };

    // Names in a scope are unique case-insensitively. Columns come
    // first, then the primary key, and then the remaining keys.
    //
    class scope: public virtual node
    {
    protected:
      typedef std::list<names*> names_list;
      typedef std::map<string, names_list::iterator> names_map;

    public:
      typedef pointer_iterator<names_list::iterator> names_iterator;
      typedef
      pointer_iterator<names_list::const_iterator>
      names_const_iterator;

      typedef names_list::size_type size_type;

    public:
      // Iteration.
      //
      names_iterator
      names_begin ()
      {
        return names_.begin ();
      }

      names_iterator
      names_end ()
      {
        return names_.end ();
      }

      names_const_iterator
      names_begin () const
      {
        return names_.begin ();
      }

      names_const_iterator
      names_end () const
      {
        return names_.end ();
      }

      size_type
      names_size () const
      {
        return names_.size ();
      }

      // Find.
      //
      names_iterator
      find (string const& name);

      names_const_iterator
      find (string const& name) const;

      template <typename T>
      T*
      find (string const& name) const
      {
        names_map::const_iterator i (names_map_.find (ukey (name)));

        return i != names_map_.end ()
          ? dynamic_cast<T*> (&(*i->second)->nameable ())
          : 0;
      }

    public:
      scope ()
          : first_key_ (names_.end ())
      {
      }

      // Throw duplicate_name if the name is already used in this scope.
      //
      void
      add_edge_left (names&);

    private:
      names_list names_;
      names_map names_map_;

      names_list::iterator first_key_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_ELEMENTS_HXX

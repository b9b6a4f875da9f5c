// file      : sqlgen/semantics/relational/key.hxx
// license   : GNU GPL v3; see accompanying LICENSE file

#ifndef SQLGEN_SEMANTICS_RELATIONAL_KEY_HXX
#define SQLGEN_SEMANTICS_RELATIONAL_KEY_HXX

#include <sqlgen/semantics/relational/elements.hxx>

namespace semantics
{
  namespace relational
  {
    class key;
    class column;

    class contains: public edge
    {
    public:
      typedef relational::key key_type;
      typedef relational::column column_type;

      key_type&
      key () const
      {
        return *key_;
      }

      column_type&
      column () const
      {
        return *column_;
      }

    public:
      void
      set_left_node (key_type& n)
      {
        key_ = &n;
      }

      void
      set_right_node (column_type& n)
      {
        column_ = &n;
      }

    protected:
      key_type* key_;
      column_type* column_;
    };

    // Base for the primary key, foreign keys, and indexes. Unnamed keys
    // are given names that cannot clash with SQL identifiers.
    //
    class key: public nameable
    {
      typedef std::vector<contains*> contains_list;

    public:
      typedef
      pointer_iterator<contains_list::const_iterator>
      contains_iterator;

      contains_iterator
      contains_begin () const
      {
        return contains_.begin ();
      }

      contains_iterator
      contains_end () const
      {
        return contains_.end ();
      }

      contains_list::size_type
      contains_size () const
      {
        return contains_.size ();
      }

      contains&
      contains_at (contains_list::size_type i) const
      {
        return *contains_[i];
      }

      // True if the key was given a name in the source.
      //
      bool
      named_in_source () const
      {
        return named_in_source_;
      }

    public:
      key (location const& l, bool named_in_source)
          : nameable (l), named_in_source_ (named_in_source)
      {
      }

      void
      add_edge_left (contains& e)
      {
        contains_.push_back (&e);
      }

    private:
      contains_list contains_;
      bool named_in_source_;
    };
  }
}

#endif // SQLGEN_SEMANTICS_RELATIONAL_KEY_HXX

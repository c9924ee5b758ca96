#ifndef __ELEMENTS_HPP__
#define __ELEMENTS_HPP__

typedef int UserId;
typedef int ItemId;

// Implicit (positive-only) interaction. Any record type exposing
// user_id(), item_id() and weight() can be fed to the templated entry points.
class UnweightedInteraction {
  UserId uid;
  ItemId iid;

  public:
    UnweightedInteraction() : uid(0), iid(0) {}
    UnweightedInteraction(UserId u, ItemId i) : uid(u), iid(i) {}

    UserId user_id() const { return uid; }
    ItemId item_id() const { return iid; }
    float  weight() const { return 1.f; }
};

#endif

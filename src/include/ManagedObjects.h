#ifndef MANAGED_OBJECTS_h
#define MANAGED_OBJECTS_h

#include "BER.h"
#include "ValueCallbacks.h"
#include "defs.h"

#include <deque>
#include <memory>

class ManagedObject {
  public:
    ManagedObject(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter, const ValueSetter& setter):
        oid(oid), getter(getter), setter(setter){};

    const std::shared_ptr<OIDType> oid;
    const ValueGetter getter;
    const ValueSetter setter;
};

typedef enum {
    SNMP_LOOKUP_EXACT,
    SNMP_LOOKUP_NEXT // first object strictly after the given OID
} SNMP_LOOKUP_MODE;

// Objects kept sorted by OID. Registration is meant for setup, lookups are not synchronised with it.
class ManagedObjectRegistry {
  public:
    typedef std::deque<std::shared_ptr<const ManagedObject>> ObjectList;

    // A null setter means the object answers every Set with notWritable
    SNMP_REGISTER_RESULT registerObject(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter,
                                        const ValueSetter& setter = nullptr);

    std::shared_ptr<const ManagedObject> lookup(const OIDType& oid, SNMP_LOOKUP_MODE mode) const;

    size_t size() const {
        return this->objects.size();
    }

    bool empty() const {
        return this->objects.empty();
    }

    ObjectList::const_iterator begin() const {
        return this->objects.begin();
    }

    ObjectList::const_iterator end() const {
        return this->objects.end();
    }

  private:
    ObjectList objects;
};

#endif

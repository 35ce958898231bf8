#include "include/ManagedObjects.h"

#include <algorithm>

static bool object_before_oid(const std::shared_ptr<const ManagedObject>& object, const OIDType& oid){
    return object->oid->compare(oid) < 0;
}

static bool oid_before_object(const OIDType& oid, const std::shared_ptr<const ManagedObject>& object){
    return oid.compare(*object->oid) < 0;
}

SNMP_REGISTER_RESULT ManagedObjectRegistry::registerObject(const std::shared_ptr<OIDType>& oid, const ValueGetter& getter,
                                                           const ValueSetter& setter){
    if(!oid || !oid->valid){
        SNMP_LOGW("Refusing to register an invalid OID\n");
        return SNMP_REGISTER_INVALID_OID;
    }

    if(!getter){
        SNMP_LOGW("Refusing to register %s without a getter\n", oid->string().c_str());
        return SNMP_REGISTER_MISSING_GETTER;
    }

    auto it = std::lower_bound(this->objects.begin(), this->objects.end(), *oid, object_before_oid);
    if(it != this->objects.end() && (*it)->oid->equals(oid.get())){
        SNMP_LOGW("OID %s is already registered\n", oid->string().c_str());
        return SNMP_REGISTER_ALREADY_REGISTERED;
    }

    // Own a copy so the caller can't reorder us by mutating theirs
    std::shared_ptr<const ManagedObject> object = std::make_shared<ManagedObject>(oid->cloneOID(), getter,
                                                                                 setter ? setter : not_writable_setter());
    this->objects.insert(it, object);

    SNMP_LOGD("Registered %s, %lu objects\n", oid->string().c_str(), (unsigned long)this->objects.size());
    return SNMP_REGISTER_OK;
}

std::shared_ptr<const ManagedObject> ManagedObjectRegistry::lookup(const OIDType& oid, SNMP_LOOKUP_MODE mode) const {
    switch(mode){
        case SNMP_LOOKUP_EXACT:
        {
            auto it = std::lower_bound(this->objects.begin(), this->objects.end(), oid, object_before_oid);
            if(it != this->objects.end() && (*it)->oid->equals(&oid)){
                return *it;
            }
        }
        break;

        case SNMP_LOOKUP_NEXT:
        {
            auto it = std::upper_bound(this->objects.begin(), this->objects.end(), oid, oid_before_object);
            if(it != this->objects.end()){
                return *it;
            }
        }
        break;
    }
    return nullptr;
}

#ifndef VarBinds_h
#define VarBinds_h

#include "BER.h"

#include <deque>
#include <memory>

class VarBind {
  public:
    VarBind(const std::shared_ptr<OIDType> &oid, const std::shared_ptr<BER_CONTAINER> &value) : oid(oid),
                                                                                                type(value->_type),
                                                                                                value(value){};

    explicit VarBind(const std::shared_ptr<OIDType> &oid) : oid(oid), type(NULLTYPE), value(new NullType()){};

    VarBind(const VarBind &vb, const std::shared_ptr<BER_CONTAINER> &value) : oid(vb.oid), type(value->_type),
                                                                              value(value){};

    VarBind(const VarBind &vb) : oid(vb.oid), type(vb.type), value(vb.value){};

    const std::shared_ptr<OIDType> oid;
    const ASN_TYPE type;
    const std::shared_ptr<BER_CONTAINER> value;

    bool equals(const VarBind &other) const {
        return this->oid->equals(other.oid.get()) && this->value->equals(other.value.get());
    }
};

typedef std::deque<VarBind> VarBindList;

#endif

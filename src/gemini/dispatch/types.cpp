#include "types.hpp"

namespace gemini::dispatch {
    RequestShape Request::shape() const {
        if (edit_base_) {
            return RequestShape::EDIT;
        }
        if (!attachments_.empty()) {
            return RequestShape::ATTACHMENT;
        }
        return RequestShape::PLAIN;
    }

    Request Request::with_model(std::string model) const {
        Request copy = *this;
        copy.model_ = std::move(model);
        return copy;
    }
}  // namespace gemini::dispatch

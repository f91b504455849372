#include "mui/drawable.hpp"
#include <algorithm>

namespace mui {

namespace {

template <typename T>
bool containsId(const std::vector<std::shared_ptr<const T>>& list, u64 id) {
    return std::any_of(list.begin(), list.end(),
                       [id](const std::shared_ptr<const T>& e) { return e->uniqueId() == id; });
}

template <typename T>
void eraseId(std::vector<std::shared_ptr<const T>>& list, u64 id) {
    list.erase(std::remove_if(list.begin(), list.end(),
                              [id](const std::shared_ptr<const T>& e) { return e->uniqueId() == id; }),
               list.end());
}

} // namespace

Drawable::Drawable(std::unique_ptr<Primitive> primitive) : primitive_(std::move(primitive)) {}

void Drawable::addModelTransform(std::shared_ptr<const ModelTransform> transform) {
    if (!transform || containsId(models_, transform->uniqueId())) return;
    models_.push_back(std::move(transform));
}

void Drawable::removeModelTransform(const ModelTransform& transform) {
    eraseId(models_, transform.uniqueId());
}

bool Drawable::hasModelTransform(const ModelTransform& transform) const {
    return containsId(models_, transform.uniqueId());
}

void Drawable::addFilterTransform(std::shared_ptr<const ColorFilter> filter) {
    if (!filter || containsId(filters_, filter->uniqueId())) return;
    filters_.push_back(std::move(filter));
}

void Drawable::removeFilterTransform(const ColorFilter& filter) {
    eraseId(filters_, filter.uniqueId());
}

bool Drawable::hasFilterTransform(const ColorFilter& filter) const {
    return containsId(filters_, filter.uniqueId());
}

glm::mat4 Drawable::evaluateModelMatrix(const DrawingContext& ctx) const {
    glm::mat4 result(1.0f);
    for (const auto& t : models_) result = t->modelMatrix(ctx) * result;
    return result;
}

glm::mat4 Drawable::evaluateFilterMatrix(const DrawingContext& ctx) const {
    glm::mat4 result(1.0f);
    for (const auto& f : filters_) result = f->filterMatrix(ctx) * result;
    return result;
}

} // namespace mui

#define TINYGLTF_IMPLEMENTATION
#define TINYGLTF_NO_STB_IMAGE
#define TINYGLTF_NO_STB_IMAGE_WRITE
#define TINYGLTF_NO_EXTERNAL_IMAGE
#include <tiny_gltf.h>

#include "gltf_import.h"
#include "../timer.h"

#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/type_ptr.hpp>

#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <iostream>


namespace {
    //! images are kept undecoded, only geometry and flat colors are used
    bool skip_image(tinygltf::Image *, const int, std::string *, std::string *, int, int, const unsigned char *, int, void *) {
        return true;
    }

    //! bounds checked, strided view on one accessor
    class accessor_reader {
        const unsigned char *_data = nullptr;
        size_t _stride = 0;
        size_t _count = 0;
        int _component_type = 0;
        int _num_components = 0;
        bool _normalized = false;

    public:
        bool init(const tinygltf::Model &model, const int accessor_id, std::string &err) {
            if(accessor_id < 0 || accessor_id >= (int)model.accessors.size()) {
                err = "invalid accessor " + std::to_string(accessor_id);
                return false;
            }
            const tinygltf::Accessor &acc = model.accessors[accessor_id];
            if(acc.sparse.isSparse) {
                err = "sparse accessors are not supported";
                return false;
            }
            if(acc.bufferView < 0 || acc.bufferView >= (int)model.bufferViews.size()) {
                err = "accessor " + std::to_string(accessor_id) + " has no buffer view";
                return false;
            }
            const tinygltf::BufferView &view = model.bufferViews[acc.bufferView];
            if(view.buffer < 0 || view.buffer >= (int)model.buffers.size()) {
                err = "buffer view " + std::to_string(acc.bufferView) + " has no buffer";
                return false;
            }
            const tinygltf::Buffer &buf = model.buffers[view.buffer];

            const int stride = acc.ByteStride(view);
            const int comp_size = tinygltf::GetComponentSizeInBytes(acc.componentType);
            const int num_comp = tinygltf::GetNumComponentsInType(acc.type);
            if(stride <= 0 || comp_size <= 0 || num_comp <= 0) {
                err = "accessor " + std::to_string(accessor_id) + " has an unknown layout";
                return false;
            }

            const size_t begin = view.byteOffset + acc.byteOffset;
            const size_t end = acc.count == 0 ? begin : begin + (acc.count - 1) * (size_t)stride + (size_t)(comp_size * num_comp);
            if(end > view.byteOffset + view.byteLength || end > buf.data.size()) {
                err = "accessor " + std::to_string(accessor_id) + " exceeds its buffer";
                return false;
            }

            _data = buf.data.data() + begin;
            _stride = (size_t)stride;
            _count = acc.count;
            _component_type = acc.componentType;
            _num_components = num_comp;
            _normalized = acc.normalized;
            return true;
        }

        size_t count() const {
            return _count;
        }
        int components() const {
            return _num_components;
        }

        //! component c of element n, normalized integers are mapped to [0, 1] / [-1, 1]
        float component(const size_t n, const int c) const {
            const unsigned char *p = _data + n * _stride;
            switch(_component_type) {
                case TINYGLTF_COMPONENT_TYPE_FLOAT: {
                    float v;
                    std::memcpy(&v, p + c * sizeof(float), sizeof(float));
                    return v;
                }
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE: {
                    const uint8_t v = p[c];
                    return _normalized ? v / 255.f : (float)v;
                }
                case TINYGLTF_COMPONENT_TYPE_BYTE: {
                    int8_t v;
                    std::memcpy(&v, p + c, 1);
                    return _normalized ? std::max(v / 127.f, -1.f) : (float)v;
                }
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT: {
                    uint16_t v;
                    std::memcpy(&v, p + c * sizeof(uint16_t), sizeof(uint16_t));
                    return _normalized ? v / 65535.f : (float)v;
                }
                case TINYGLTF_COMPONENT_TYPE_SHORT: {
                    int16_t v;
                    std::memcpy(&v, p + c * sizeof(int16_t), sizeof(int16_t));
                    return _normalized ? std::max(v / 32767.f, -1.f) : (float)v;
                }
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT: {
                    uint32_t v;
                    std::memcpy(&v, p + c * sizeof(uint32_t), sizeof(uint32_t));
                    return (float)v;
                }
                default:
                    return 0.f;
            }
        }

        uint32_t index(const size_t n) const {
            const unsigned char *p = _data + n * _stride;
            switch(_component_type) {
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_BYTE:
                    return p[0];
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_SHORT: {
                    uint16_t v;
                    std::memcpy(&v, p, sizeof(uint16_t));
                    return v;
                }
                case TINYGLTF_COMPONENT_TYPE_UNSIGNED_INT: {
                    uint32_t v;
                    std::memcpy(&v, p, sizeof(uint32_t));
                    return v;
                }
                default:
                    return 0;
            }
        }
    };

    glm::dmat4 local_transform(const tinygltf::Node &node) {
        if(node.matrix.size() == 16) {
            return glm::make_mat4(node.matrix.data());
        }
        glm::dmat4 t(1), r(1), s(1);
        if(node.translation.size() == 3) {
            t = glm::translate(glm::dmat4(1), glm::make_vec3(node.translation.data()));
        }
        if(node.rotation.size() == 4) {
            // stored as x, y, z, w
            r = glm::mat4_cast(glm::dquat(node.rotation[3], node.rotation[0], node.rotation[1], node.rotation[2]));
        }
        if(node.scale.size() == 3) {
            s = glm::scale(glm::dmat4(1), glm::make_vec3(node.scale.data()));
        }
        return t * r * s;
    }

    class soup_builder {
        const tinygltf::Model &_model;
        mesh::triangle_soup &_soup;
        bool _any_color = false;
        size_t _skipped = 0;

        uint32_t material_color(const int material_id) const {
            if(material_id < 0 || material_id >= (int)_model.materials.size()) {
                return mesh::no_color;
            }
            const std::vector<double> &f = _model.materials[material_id].pbrMetallicRoughness.baseColorFactor;
            if(f.size() < 3) {
                return mesh::no_color;
            }
            return mesh::pack_rgb(glm::vec3(f[0], f[1], f[2]));
        }

        bool add_primitive(const tinygltf::Primitive &prim, const glm::dmat4 &transform, std::string &err) {
            if(prim.mode != TINYGLTF_MODE_TRIANGLES && prim.mode != -1) {
                _skipped++;
                return true;
            }
            const auto pos_it = prim.attributes.find("POSITION");
            if(pos_it == prim.attributes.end()) {
                _skipped++;
                return true;
            }

            accessor_reader positions;
            if(!positions.init(_model, pos_it->second, err) || positions.components() < 3) {
                if(err.empty()) err = "POSITION is not a vec3";
                return false;
            }

            accessor_reader colors;
            bool has_colors = false;
            const auto col_it = prim.attributes.find("COLOR_0");
            if(col_it != prim.attributes.end()) {
                if(!colors.init(_model, col_it->second, err)) {
                    return false;
                }
                has_colors = colors.components() >= 3 && colors.count() == positions.count();
            }

            std::vector<uint32_t> indices;
            if(prim.indices >= 0) {
                accessor_reader idx;
                if(!idx.init(_model, prim.indices, err)) {
                    return false;
                }
                indices.reserve(idx.count());
                for(size_t n = 0; n < idx.count(); n++) {
                    indices.push_back(idx.index(n));
                }
            }
            else {
                for(uint32_t n = 0; n < (uint32_t)positions.count(); n++) {
                    indices.push_back(n);
                }
            }

            const uint32_t flat_color = material_color(prim.material);
            for(size_t n = 0; n + 2 < indices.size(); n += 3) {
                const uint32_t ids[3] = { indices[n], indices[n+1], indices[n+2] };
                if(ids[0] >= positions.count() || ids[1] >= positions.count() || ids[2] >= positions.count()) {
                    _skipped++;
                    continue;
                }
                for(const uint32_t id : ids) {
                    const glm::dvec4 p(positions.component(id, 0), positions.component(id, 1), positions.component(id, 2), 1.0);
                    _soup._positions.push_back(glm::vec3(transform * p));

                    const uint32_t c = has_colors
                        ? mesh::pack_rgb(glm::vec3(colors.component(id, 0), colors.component(id, 1), colors.component(id, 2)))
                        : flat_color;
                    _soup._colors.push_back(c);
                    _any_color = _any_color || c != mesh::no_color;
                }
            }
            return true;
        }

    public:
        soup_builder(const tinygltf::Model &model, mesh::triangle_soup &soup)
            : _model(model)
            , _soup(soup)
        {}

        bool add_mesh(const int mesh_id, const glm::dmat4 &transform, std::string &err) {
            if(mesh_id < 0 || mesh_id >= (int)_model.meshes.size()) {
                err = "invalid mesh " + std::to_string(mesh_id);
                return false;
            }
            for(const tinygltf::Primitive &prim : _model.meshes[mesh_id].primitives) {
                if(!add_primitive(prim, transform, err)) {
                    return false;
                }
            }
            return true;
        }

        //! depth first, `depth` guards against cyclic node graphs
        bool add_node(const int node_id, const glm::dmat4 &parent, const size_t depth, std::string &err) {
            if(node_id < 0 || node_id >= (int)_model.nodes.size() || depth > _model.nodes.size()) {
                err = "invalid node hierarchy";
                return false;
            }
            const tinygltf::Node &node = _model.nodes[node_id];
            const glm::dmat4 transform = parent * local_transform(node);
            if(node.mesh >= 0 && !add_mesh(node.mesh, transform, err)) {
                return false;
            }
            for(const int child : node.children) {
                if(!add_node(child, transform, depth + 1, err)) {
                    return false;
                }
            }
            return true;
        }

        void finish() {
            if(!_any_color) {
                _soup._colors.clear();
            }
            if(_skipped > 0) {
                std::cerr << "gltf::load(): skipped " << _skipped << " primitives or triangles" << std::endl;
            }
        }
    };
};

namespace gltf {
    bool load(const std::string &path, mesh::triangle_soup &soup, std::string &err) {
        benchmark::timer tmp("gltf::load()");
        soup.clear();

        tinygltf::Model model;
        tinygltf::TinyGLTF loader;
        loader.SetImageLoader(skip_image, nullptr);

        std::string ext = std::filesystem::path(path).extension().string();
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) { return (char)std::tolower(c); });

        std::string load_err, load_warn;
        const bool ok = ext == ".glb"
            ? loader.LoadBinaryFromFile(&model, &load_err, &load_warn, path)
            : loader.LoadASCIIFromFile(&model, &load_err, &load_warn, path);
        if(!load_warn.empty()) {
            std::cerr << "gltf::load(): " << load_warn << std::endl;
        }
        if(!ok) {
            err = path + ": " + (load_err.empty() ? std::string("could not be loaded") : load_err);
            return false;
        }

        soup_builder builder(model, soup);
        bool built = true;
        if(model.scenes.empty()) {
            for(int m = 0; m < (int)model.meshes.size() && built; m++) {
                built = builder.add_mesh(m, glm::dmat4(1), err);
            }
        }
        else {
            const int scene_id = model.defaultScene >= 0 && model.defaultScene < (int)model.scenes.size() ? model.defaultScene : 0;
            for(const int node_id : model.scenes[scene_id].nodes) {
                built = builder.add_node(node_id, glm::dmat4(1), 0, err);
                if(!built) break;
            }
        }
        if(!built) {
            soup.clear();
            err = path + ": " + err;
            return false;
        }
        builder.finish();

        if(soup._positions.empty()) {
            err = path + ": no triangles found";
            return false;
        }
        std::cout << "gltf::load(): " << soup.num_faces() << " triangles" << std::endl;
        return true;
    }
};

#pragma once

#include <cstddef>
#include <ostream>

#include "mesh_generator.h"

class ObjMeshSink final : public MeshSink
{
public:
    explicit ObjMeshSink(std::ostream& out);

    MeshHandle spawn(const meshing::PosNormMesh& mesh) override;

    // Written geometry cannot be retracted; the handle is only counted.
    void despawn(MeshHandle handle) override;

    [[nodiscard]] std::size_t meshesWritten() const noexcept { return meshesWritten_; }
    [[nodiscard]] std::size_t meshesDespawned() const noexcept { return meshesDespawned_; }
    [[nodiscard]] std::size_t verticesWritten() const noexcept { return vertexBase_; }

private:
    std::ostream& out_;
    std::size_t vertexBase_{0};
    std::size_t meshesWritten_{0};
    std::size_t meshesDespawned_{0};
    MeshHandle nextHandle_{1};
};

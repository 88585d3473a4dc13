#include "obj_mesh_sink.h"

#include <iomanip>
#include <limits>
#include <stdexcept>

ObjMeshSink::ObjMeshSink(std::ostream& out)
    : out_(out)
{
    // Enough digits that every float reads back unchanged.
    out_ << std::setprecision(std::numeric_limits<float>::max_digits10);
}

MeshHandle ObjMeshSink::spawn(const meshing::PosNormMesh& mesh)
{
    const MeshHandle handle = nextHandle_++;

    out_ << "o chunk_" << handle << '\n';
    for (const glm::vec3& p : mesh.positions)
    {
        out_ << "v " << p.x << ' ' << p.y << ' ' << p.z << '\n';
    }
    for (const glm::vec3& n : mesh.normals)
    {
        out_ << "vn " << n.x << ' ' << n.y << ' ' << n.z << '\n';
    }

    // OBJ indices are 1-based and global to the file.
    for (std::size_t i = 0; i + 2 < mesh.indices.size(); i += 3)
    {
        out_ << 'f';
        for (std::size_t corner = 0; corner < 3; ++corner)
        {
            const std::size_t index = vertexBase_ + mesh.indices[i + corner] + 1;
            out_ << ' ' << index << "//" << index;
        }
        out_ << '\n';
    }

    if (!out_)
    {
        throw std::runtime_error("Failed to write OBJ output");
    }

    vertexBase_ += mesh.positions.size();
    ++meshesWritten_;
    return handle;
}

void ObjMeshSink::despawn(MeshHandle)
{
    ++meshesDespawned_;
}

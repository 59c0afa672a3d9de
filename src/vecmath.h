#ifndef _VECTOR_MATH_H
#define _VECTOR_MATH_H

struct Vector2
{
    float x;
    float y;

    Vector2() : x(0.0f), y(0.0f) {}
    Vector2(float xVal, float yVal) : x(xVal), y(yVal) {}
};

// Used for RGBA colours as well as homogeneous clip-space positions
struct Vector4
{
    float x;
    float y;
    float z;
    float w;

    Vector4() : x(0.0f), y(0.0f), z(0.0f), w(0.0f) {}
    Vector4(float xVal, float yVal, float zVal, float wVal)
        : x(xVal), y(yVal), z(zVal), w(wVal) {}
};

// NOTE: Vector*Vector and Vector/Vector are component-wise, as in GLSL.
//       Dividing by a zero component is not checked and yields inf/NaN.
Vector2 operator +(Vector2 lhs, Vector2 rhs);
Vector2 operator *(Vector2 lhs, float rhs);
Vector2 operator *(Vector2 lhs, Vector2 rhs);
Vector2 operator /(Vector2 lhs, Vector2 rhs);
Vector2 operator -(Vector2 lhs, float rhs);

Vector4 operator +(Vector4 lhs, Vector4 rhs);
Vector4 operator *(Vector4 lhs, float rhs);
Vector4 operator *(Vector4 lhs, Vector4 rhs);

bool operator ==(Vector2 lhs, Vector2 rhs);
bool operator ==(Vector4 lhs, Vector4 rhs);


int clamp(int x, int min, int max);
float clampf(float x, float min, float max);

#endif

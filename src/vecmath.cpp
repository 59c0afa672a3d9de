#include "vecmath.h"

// ==========================
// Vector2 operator overloads
// ==========================
Vector2 operator +(Vector2 lhs, Vector2 rhs)
{
    return Vector2(lhs.x + rhs.x, lhs.y + rhs.y);
}

Vector2 operator *(Vector2 lhs, float rhs)
{
    return Vector2(lhs.x * rhs, lhs.y * rhs);
}

Vector2 operator *(Vector2 lhs, Vector2 rhs)
{
    return Vector2(lhs.x * rhs.x, lhs.y * rhs.y);
}

Vector2 operator /(Vector2 lhs, Vector2 rhs)
{
    return Vector2(lhs.x / rhs.x, lhs.y / rhs.y);
}

Vector2 operator -(Vector2 lhs, float rhs)
{
    return Vector2(lhs.x - rhs, lhs.y - rhs);
}

bool operator ==(Vector2 lhs, Vector2 rhs)
{
    return (lhs.x == rhs.x) && (lhs.y == rhs.y);
}

// ==========================
// Vector4 operator overloads
// ==========================
Vector4 operator +(Vector4 lhs, Vector4 rhs)
{
    return Vector4(lhs.x + rhs.x, lhs.y + rhs.y, lhs.z + rhs.z, lhs.w + rhs.w);
}

Vector4 operator *(Vector4 lhs, float rhs)
{
    return Vector4(lhs.x * rhs, lhs.y * rhs, lhs.z * rhs, lhs.w * rhs);
}

Vector4 operator *(Vector4 lhs, Vector4 rhs)
{
    return Vector4(lhs.x * rhs.x, lhs.y * rhs.y, lhs.z * rhs.z, lhs.w * rhs.w);
}

bool operator ==(Vector4 lhs, Vector4 rhs)
{
    return (lhs.x == rhs.x) && (lhs.y == rhs.y) && (lhs.z == rhs.z) && (lhs.w == rhs.w);
}

// ========================
// Function implementations
// ========================
int clamp(int x, int min, int max)
{
    if(x < min)
    {
        x = min;
    }
    else if(x > max)
    {
        x = max;
    }
    return x;
}

float clampf(float x, float min, float max)
{
    if(x < min)
    {
        x = min;
    }
    else if(x > max)
    {
        x = max;
    }
    return x;
}
